#ifndef SOLANA_PUBKEY_HPP
#define SOLANA_PUBKEY_HPP

#include"Solana/Detail/Base58Bytes.hpp"

namespace Solana {

/** class Solana::Pubkey
 *
 * @brief a 32-byte account address.
 *
 * @desc Most addresses are ed25519 public keys, but
 * program-derived addresses are deliberately off
 * the curve.
 * The all-zero key is the system program.
 */
class Pubkey : public Detail::Base58Bytes<32> {
public:
	Pubkey() =default;
	explicit
	Pubkey(std::string const& s) : Detail::Base58Bytes<32>(s) { }

	static
	Pubkey from_buffer(std::uint8_t const d[32]) {
		auto rv = Pubkey();
		rv.Detail::Base58Bytes<32>::from_buffer(d);
		return rv;
	}

	/* Whether the bytes decode as an ed25519 point.  */
	bool is_on_curve() const;
};

/** class Solana::Blockhash
 *
 * @brief a recent blockhash, which bounds the
 * lifetime of a transaction.
 */
class Blockhash : public Detail::Base58Bytes<32> {
public:
	Blockhash() =default;
	explicit
	Blockhash(std::string const& s) : Detail::Base58Bytes<32>(s) { }
};

/** class Solana::Signature
 *
 * @brief an ed25519 signature, which also serves as
 * the identifier of the transaction it signs.
 */
class Signature : public Detail::Base58Bytes<64> {
public:
	Signature() =default;
	explicit
	Signature(std::string const& s) : Detail::Base58Bytes<64>(s) { }

	static
	Signature from_buffer(std::uint8_t const d[64]) {
		auto rv = Signature();
		rv.Detail::Base58Bytes<64>::from_buffer(d);
		return rv;
	}
};

}

#endif /* !defined(SOLANA_PUBKEY_HPP) */
