#include"Digest/read_file.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include"Solana/Keypair.hpp"
#include<sodium/crypto_sign.h>
#include<sodium/utils.h>
#include<string.h>

namespace Solana {

Keypair::Keypair() {
	memset(secret, 0, sizeof(secret));
}
Keypair::Keypair(Keypair const& o) : pub(o.pub) {
	memcpy(secret, o.secret, sizeof(secret));
}
Keypair& Keypair::operator=(Keypair const& o) {
	memcpy(secret, o.secret, sizeof(secret));
	pub = o.pub;
	return *this;
}
Keypair::~Keypair() {
	sodium_memzero(secret, sizeof(secret));
}

Keypair Keypair::from_seed(std::uint8_t const seed[32]) {
	auto rv = Keypair();
	std::uint8_t pk[crypto_sign_PUBLICKEYBYTES];
	crypto_sign_seed_keypair(pk, rv.secret, seed);
	rv.pub = Pubkey::from_buffer(pk);
	return rv;
}

Keypair Keypair::parse(std::string const& json) {
	auto parser = Jsmn::Parser();
	auto js = std::vector<Jsmn::Object>();
	try {
		js = parser.feed(json + "\n");
	} catch (Jsmn::ParseError const& e) {
		throw KeypairError(std::string("Keypair is not JSON: ") + e.what());
	}
	if (js.size() != 1 || !js[0].is_array() || js[0].size() != 64)
		throw KeypairError("Keypair must be a JSON array of 64 bytes");

	std::uint8_t bytes[64];
	for (auto i = std::size_t(0); i < 64; ++i) {
		auto e = js[0][i];
		if (!e.is_number())
			throw KeypairError("Keypair must be a JSON array of 64 bytes");
		auto d = double(e);
		if (d < 0 || d > 255 || d != double(int(d)))
			throw KeypairError("Keypair byte out of range");
		bytes[i] = std::uint8_t(int(d));
	}

	auto rv = from_seed(bytes);
	auto ok = sodium_memcmp(rv.secret, bytes, 64) == 0;
	sodium_memzero(bytes, sizeof(bytes));
	if (!ok)
		throw KeypairError("Keypair public key does not match its secret");
	return rv;
}

Keypair Keypair::load_file(std::string const& path) {
	auto content = std::vector<std::uint8_t>();
	try {
		content = Digest::read_file(path);
	} catch (Digest::ReadError const& e) {
		throw KeypairError(e.what());
	}
	auto json = std::string(content.begin(), content.end());
	sodium_memzero(content.data(), content.size());
	try {
		auto rv = parse(json);
		sodium_memzero(&json[0], json.size());
		return rv;
	} catch (KeypairError const& e) {
		sodium_memzero(&json[0], json.size());
		throw KeypairError(path + ": " + e.what());
	}
}

Signature Keypair::sign(std::uint8_t const* msg, std::size_t len) const {
	std::uint8_t sig[crypto_sign_BYTES];
	crypto_sign_detached(sig, nullptr, msg, len, secret);
	return Signature::from_buffer(sig);
}

bool verify_signature( Pubkey const& signer
		     , Signature const& sig
		     , std::vector<std::uint8_t> const& msg
		     ) {
	return crypto_sign_verify_detached( sig.data()
					  , msg.data(), msg.size()
					  , signer.data()
					  ) == 0;
}

}
