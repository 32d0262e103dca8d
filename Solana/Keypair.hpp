#ifndef SOLANA_KEYPAIR_HPP
#define SOLANA_KEYPAIR_HPP

#include"Solana/Pubkey.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Solana {

/* Thrown if a keypair file cannot be read or does
 * not hold a consistent ed25519 keypair.  */
class KeypairError : public Util::BacktraceException<std::runtime_error> {
public:
	KeypairError(std::string const& msg
		    ) : Util::BacktraceException<std::runtime_error>(msg) { }
};

/** class Solana::Keypair
 *
 * @brief an ed25519 signing key and its public key.
 *
 * @desc The secret is wiped from memory when the
 * object is destroyed.
 */
class Keypair {
private:
	/* Seed followed by public key.  */
	std::uint8_t secret[64];
	Pubkey pub;

	Keypair();

public:
	Keypair(Keypair const&);
	Keypair& operator=(Keypair const&);
	~Keypair();

	static
	Keypair from_seed(std::uint8_t const seed[32]);

	/** Solana::Keypair::load_file
	 *
	 * @brief load a keypair file in the format the
	 * Solana command line tools write: a JSON
	 * array of 64 byte values, the seed followed
	 * by the public key.
	 */
	static
	Keypair load_file(std::string const& path);
	/* Same, from the file contents.  */
	static
	Keypair parse(std::string const& json);

	Pubkey const& pubkey() const { return pub; }

	Signature sign(std::uint8_t const* msg, std::size_t len) const;
	Signature sign(std::vector<std::uint8_t> const& msg) const {
		return sign(msg.data(), msg.size());
	}
};

/* Check an ed25519 signature.  */
bool verify_signature( Pubkey const& signer
		     , Signature const& sig
		     , std::vector<std::uint8_t> const& msg
		     );

}

#endif /* !defined(SOLANA_KEYPAIR_HPP) */
