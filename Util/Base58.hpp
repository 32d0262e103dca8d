#ifndef UTIL_BASE58_HPP
#define UTIL_BASE58_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Util { namespace Base58 {

/** Util::Base58::encode
 *
 * @brief encode the given bytes in the Bitcoin
 * base58 alphabet (no checksum).
 *
 * @desc Each leading zero byte is rendered as a
 * leading `1` character.
 */
std::string encode(std::uint8_t const* p, std::size_t len);
inline
std::string encode(std::vector<std::uint8_t> const& v) {
	return encode(v.data(), v.size());
}

/** Util::Base58::decode
 *
 * @brief decode a base58 string.
 *
 * @return true if decoding succeeded, false if
 * the string contains a character outside the
 * alphabet.
 */
bool decode( std::vector<std::uint8_t>& data
	   , std::string const& base58
	   );

}}

#endif /* !defined(UTIL_BASE58_HPP) */
