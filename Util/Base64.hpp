#ifndef UTIL_BASE64_HPP
#define UTIL_BASE64_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Util { namespace Base64 {

/** Util::Base64::encode
 *
 * @brief encode bytes in standard (RFC 4648)
 * base64 with `=` padding.
 */
std::string encode(std::uint8_t const* p, std::size_t len);
inline
std::string encode(std::vector<std::uint8_t> const& v) {
	return encode(v.data(), v.size());
}

/** Util::Base64::decode
 *
 * @brief decode standard base64.
 *
 * @return true if decoding succeeded.
 * Padding is optional; whitespace is not accepted.
 */
bool decode( std::vector<std::uint8_t>& data
	   , std::string const& base64
	   );

}}

#endif /* !defined(UTIL_BASE64_HPP) */
