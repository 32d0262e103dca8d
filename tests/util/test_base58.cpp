#undef NDEBUG
#include"Util/Base58.hpp"
#include<assert.h>

int main() {
	auto data = std::vector<std::uint8_t>();

	assert(Util::Base58::encode(data) == "");
	assert(Util::Base58::decode(data, ""));
	assert(data.empty());

	/* Leading zeros become leading ones.  */
	data = {0, 0, 1};
	assert(Util::Base58::encode(data) == "112");
	assert(Util::Base58::decode(data, "112"));
	assert((data == std::vector<std::uint8_t>{0, 0, 1}));

	/* All-zero 32 bytes, the system program.  */
	data = std::vector<std::uint8_t>(32, 0);
	assert(Util::Base58::encode(data) == "11111111111111111111111111111111");

	data = {'h', 'e', 'l', 'l', 'o'};
	assert(Util::Base58::encode(data) == "Cn8eVZg");
	assert(Util::Base58::decode(data, "Cn8eVZg"));
	assert((data == std::vector<std::uint8_t>{'h', 'e', 'l', 'l', 'o'}));

	/* 0, O, I and l are not in the alphabet.  */
	assert(!Util::Base58::decode(data, "0abc"));
	assert(!Util::Base58::decode(data, "Oabc"));
	assert(!Util::Base58::decode(data, "Iabc"));
	assert(!Util::Base58::decode(data, "labc"));
	assert(!Util::Base58::decode(data, "ab c"));

	return 0;
}
