#ifndef SOLANA_INSTRUCTION_HPP
#define SOLANA_INSTRUCTION_HPP

#include"Solana/Pubkey.hpp"
#include<cstdint>
#include<vector>

namespace Solana {

struct AccountMeta {
	Pubkey pubkey;
	bool is_signer;
	bool is_writable;
};

/** struct Solana::Instruction
 *
 * @brief a call to an on-chain program with the
 * accounts it touches and its opaque data.
 */
struct Instruction {
	Pubkey program_id;
	std::vector<AccountMeta> accounts;
	std::vector<std::uint8_t> data;
};

}

#endif /* !defined(SOLANA_INSTRUCTION_HPP) */
