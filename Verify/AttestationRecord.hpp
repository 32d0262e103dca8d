#ifndef VERIFY_ATTESTATIONRECORD_HPP
#define VERIFY_ATTESTATIONRECORD_HPP

#include"Sha256/Hash.hpp"
#include"Solana/Instruction.hpp"
#include"Solana/Pda.hpp"
#include"Solana/Pubkey.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Verify {

/** struct Verify::AttestationRecord
 *
 * @brief the account a registry program keeps for
 * each (program, signer) pair.
 *
 * @desc Layout: 8-byte discriminator, program id,
 * digest, signer, slot (u64 LE), then the unix
 * timestamp of the write (i64 LE), 120 bytes in
 * all.
 */
struct AttestationRecord {
	Solana::Pubkey program_id;
	Sha256::Hash digest;
	Solana::Pubkey signer;
	std::uint64_t slot;
	std::int64_t timestamp;

	static constexpr std::size_t size = 120;

	std::vector<std::uint8_t> encode() const;
	/* False if the data is too short or does not
	 * start with the record discriminator.  */
	static
	bool decode( AttestationRecord& out
		   , std::vector<std::uint8_t> const& data
		   );
};

/** Verify::discriminator
 *
 * @brief the first eight bytes of the SHA-256 of
 * the given name, as registry programs tag their
 * accounts ("account:...") and instructions
 * ("global:...").
 */
std::vector<std::uint8_t> discriminator(std::string const& name);

/* Where the attestation of `signer` for
 * `program_id` lives.  */
Solana::ProgramAddress attestation_address( Solana::Pubkey const& registry
					  , Solana::Pubkey const& program_id
					  , Solana::Pubkey const& signer
					  );

/** Verify::attest_instruction
 *
 * @brief the registry instruction that creates or
 * updates the attestation account.
 */
Solana::Instruction attest_instruction( Solana::Pubkey const& registry
				      , Solana::Pubkey const& program_id
				      , Solana::Pubkey const& signer
				      , Sha256::Hash const& digest
				      , std::uint64_t slot
				      );

}

#endif /* !defined(VERIFY_ATTESTATIONRECORD_HPP) */
