#include"Solana/Pubkey.hpp"
#include<sodium/crypto_core_ed25519.h>

namespace Solana {

bool Pubkey::is_on_curve() const {
	/* libsodium rejects non-canonical and off-curve
	 * encodings as inputs to point addition.  */
	std::uint8_t out[crypto_core_ed25519_BYTES];
	return crypto_core_ed25519_add(out, raw, raw) == 0;
}

}
