#include"Util/Base58.hpp"
#include<algorithm>

namespace {

auto const base58_chars = std::string(
	"123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"
);

int decode_char(char c) {
	auto pos = base58_chars.find(c);
	if (pos == std::string::npos)
		return -1;
	return int(pos);
}

}

namespace Util { namespace Base58 {

std::string encode(std::uint8_t const* p, std::size_t len) {
	auto zeroes = std::size_t(0);
	while (zeroes < len && p[zeroes] == 0)
		++zeroes;

	/* Big-endian base-58 digits, computed by repeated
	 * multiply-and-add over the input bytes.  */
	auto digits = std::vector<std::uint8_t>();
	digits.reserve((len - zeroes) * 138 / 100 + 1);
	for (auto i = zeroes; i < len; ++i) {
		auto carry = unsigned(p[i]);
		for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
			carry += unsigned(*it) << 8;
			*it = std::uint8_t(carry % 58);
			carry /= 58;
		}
		while (carry != 0) {
			digits.insert(digits.begin(), std::uint8_t(carry % 58));
			carry /= 58;
		}
	}

	auto rv = std::string(zeroes, '1');
	for (auto d : digits)
		rv.push_back(base58_chars[d]);
	return rv;
}

bool decode( std::vector<std::uint8_t>& data
	   , std::string const& base58
	   ) {
	auto ones = std::size_t(0);
	while (ones < base58.size() && base58[ones] == '1')
		++ones;

	auto bytes = std::vector<std::uint8_t>();
	for (auto i = ones; i < base58.size(); ++i) {
		auto v = decode_char(base58[i]);
		if (v < 0)
			return false;
		auto carry = unsigned(v);
		for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
			carry += unsigned(*it) * 58;
			*it = std::uint8_t(carry & 0xFF);
			carry >>= 8;
		}
		while (carry != 0) {
			bytes.insert(bytes.begin(), std::uint8_t(carry & 0xFF));
			carry >>= 8;
		}
	}

	data = std::vector<std::uint8_t>(ones, 0);
	data.insert(data.end(), bytes.begin(), bytes.end());
	return true;
}

}}
