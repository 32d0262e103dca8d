#ifndef SOLANA_PDA_HPP
#define SOLANA_PDA_HPP

#include"Solana/Pubkey.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Solana {

typedef std::vector<std::uint8_t> Seed;

/** struct Solana::ProgramAddress
 *
 * @brief a program-derived address and the bump
 * seed that moved it off the curve.
 */
struct ProgramAddress {
	Pubkey address;
	std::uint8_t bump;
};

/** Solana::create_program_address
 *
 * @brief hash the seeds, the program id and the
 * `ProgramDerivedAddress` marker into an address.
 *
 * @return false if the result lies on the ed25519
 * curve, in which case `out` is unchanged.
 *
 * @desc Throws `std::invalid_argument` if there are
 * more than 16 seeds or a seed is longer than 32
 * bytes.
 */
bool create_program_address( Pubkey& out
			   , std::vector<Seed> const& seeds
			   , Pubkey const& program_id
			   );

/** Solana::find_program_address
 *
 * @brief search bump seeds from 255 downwards for
 * the first that yields an off-curve address.
 */
ProgramAddress find_program_address( std::vector<Seed> const& seeds
				   , Pubkey const& program_id
				   );

/* Seed helpers.  */
inline
Seed seed(std::string const& s) {
	return Seed(s.begin(), s.end());
}
inline
Seed seed(Pubkey const& k) {
	return Seed(k.data(), k.data() + Pubkey::size);
}

}

#endif /* !defined(SOLANA_PDA_HPP) */
