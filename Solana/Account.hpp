#ifndef SOLANA_ACCOUNT_HPP
#define SOLANA_ACCOUNT_HPP

#include"Solana/Pubkey.hpp"
#include<cstdint>
#include<vector>

namespace Solana {

/** struct Solana::Account
 *
 * @brief the state of an account as read at
 * `context_slot`.
 *
 * @desc If `exists` is false, no account was found
 * at the address and the other fields are empty.
 */
struct Account {
	std::uint64_t context_slot = 0;
	bool exists = false;
	Pubkey owner;
	bool executable = false;
	std::uint64_t lamports = 0;
	std::vector<std::uint8_t> data;
};

}

#endif /* !defined(SOLANA_ACCOUNT_HPP) */
