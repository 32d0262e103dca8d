#undef NDEBUG
#include"Util/Base64.hpp"
#include<assert.h>

namespace {

std::vector<std::uint8_t> bytes(std::string const& s) {
	return std::vector<std::uint8_t>(s.begin(), s.end());
}

}

int main() {
	/* RFC 4648 test vectors.  */
	assert(Util::Base64::encode(bytes("")) == "");
	assert(Util::Base64::encode(bytes("f")) == "Zg==");
	assert(Util::Base64::encode(bytes("fo")) == "Zm8=");
	assert(Util::Base64::encode(bytes("foo")) == "Zm9v");
	assert(Util::Base64::encode(bytes("foob")) == "Zm9vYg==");
	assert(Util::Base64::encode(bytes("fooba")) == "Zm9vYmE=");
	assert(Util::Base64::encode(bytes("foobar")) == "Zm9vYmFy");

	auto data = std::vector<std::uint8_t>();
	assert(Util::Base64::decode(data, "Zm9vYmFy"));
	assert(data == bytes("foobar"));
	assert(Util::Base64::decode(data, "Zm9vYg=="));
	assert(data == bytes("foob"));
	/* Padding is optional.  */
	assert(Util::Base64::decode(data, "Zm9vYg"));
	assert(data == bytes("foob"));

	/* Bytes above 0x7f.  */
	data = {0xff, 0xfe, 0x00};
	assert(Util::Base64::encode(data) == "//4A");
	assert(Util::Base64::decode(data, "//4A"));
	assert((data == std::vector<std::uint8_t>{0xff, 0xfe, 0x00}));

	assert(!Util::Base64::decode(data, "Zm9v YmFy"));
	assert(!Util::Base64::decode(data, "Zm9v*mFy"));
	assert(!Util::Base64::decode(data, "Z"));

	return 0;
}
