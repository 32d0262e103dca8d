#include"Util/Base64.hpp"

namespace {

auto const base64_chars = std::string(
	"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"
);

int decode_char(char c) {
	if (c >= 'A' && c <= 'Z')
		return c - 'A';
	if (c >= 'a' && c <= 'z')
		return c - 'a' + 26;
	if (c >= '0' && c <= '9')
		return c - '0' + 52;
	if (c == '+')
		return 62;
	if (c == '/')
		return 63;
	return -1;
}

}

namespace Util { namespace Base64 {

std::string encode(std::uint8_t const* p, std::size_t len) {
	auto rv = std::string();
	rv.reserve(((len + 2) / 3) * 4);

	auto i = std::size_t(0);
	for (; i + 3 <= len; i += 3) {
		auto v = (std::uint32_t(p[i]) << 16)
		       | (std::uint32_t(p[i + 1]) << 8)
		       | std::uint32_t(p[i + 2])
		       ;
		rv.push_back(base64_chars[(v >> 18) & 0x3F]);
		rv.push_back(base64_chars[(v >> 12) & 0x3F]);
		rv.push_back(base64_chars[(v >> 6) & 0x3F]);
		rv.push_back(base64_chars[v & 0x3F]);
	}
	if (len - i == 1) {
		auto v = std::uint32_t(p[i]) << 16;
		rv.push_back(base64_chars[(v >> 18) & 0x3F]);
		rv.push_back(base64_chars[(v >> 12) & 0x3F]);
		rv += "==";
	} else if (len - i == 2) {
		auto v = (std::uint32_t(p[i]) << 16)
		       | (std::uint32_t(p[i + 1]) << 8)
		       ;
		rv.push_back(base64_chars[(v >> 18) & 0x3F]);
		rv.push_back(base64_chars[(v >> 12) & 0x3F]);
		rv.push_back(base64_chars[(v >> 6) & 0x3F]);
		rv.push_back('=');
	}
	return rv;
}

bool decode( std::vector<std::uint8_t>& data
	   , std::string const& base64
	   ) {
	auto end = base64.size();
	while (end > 0 && base64[end - 1] == '=')
		--end;
	/* At most two padding characters.  */
	if (base64.size() - end > 2)
		return false;
	/* A single leftover sextet cannot encode a byte.  */
	if (end % 4 == 1)
		return false;

	auto rv = std::vector<std::uint8_t>();
	rv.reserve(end * 3 / 4);

	auto acc = std::uint32_t(0);
	auto bits = 0;
	for (auto i = std::size_t(0); i < end; ++i) {
		auto v = decode_char(base64[i]);
		if (v < 0)
			return false;
		acc = (acc << 6) | std::uint32_t(v);
		bits += 6;
		if (bits >= 8) {
			bits -= 8;
			rv.push_back(std::uint8_t((acc >> bits) & 0xFF));
		}
	}

	data = std::move(rv);
	return true;
}

}}
