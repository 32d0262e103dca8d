#ifndef SOLANA_LOADERSTATE_HPP
#define SOLANA_LOADERSTATE_HPP

#include"Solana/Pubkey.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Solana { struct Account; }

namespace Solana {

/** struct Solana::ProgramAccount
 *
 * @brief how the executable of a program account
 * is to be found.
 *
 * @desc For `Upgradeable`, the executable lives in
 * the account at `programdata_address`.
 * For `Direct`, it is the program account data.
 * For `NotExecutable`, `reason` says why.
 */
struct ProgramAccount {
	enum Kind {
		Upgradeable,
		Direct,
		NotExecutable
	};
	Kind kind;
	Pubkey programdata_address;
	std::string reason;
};

/** Solana::decode_program_account
 *
 * @brief classify the account found at
 * `program_id`.
 *
 * @desc Pure; a missing account is the caller's
 * concern.
 */
ProgramAccount decode_program_account( Pubkey const& program_id
				     , Account const& account
				     );

/** struct Solana::ProgramData
 *
 * @brief decoded contents of an upgradeable
 * loader program-data account.
 */
struct ProgramData {
	std::uint64_t deployment_slot;
	bool has_upgrade_authority;
	Pubkey upgrade_authority;
	std::vector<std::uint8_t> executable;
};

/* Size of the program-data header before the
 * executable bytes.  */
auto constexpr programdata_header_size = std::size_t(45);

/** Solana::decode_program_data
 *
 * @brief check the state tag of a program-data
 * account and strip its header.
 *
 * @desc Throws `Solana::NotExecutable` if the
 * account is not program data of the upgradeable
 * loader.
 */
ProgramData decode_program_data( Pubkey const& address
			       , Account const& account
			       );

}

#endif /* !defined(SOLANA_LOADERSTATE_HPP) */
