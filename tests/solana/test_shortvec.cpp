#undef NDEBUG
#include"Solana/shortvec.hpp"
#include<assert.h>
#include<sstream>
#include<stdexcept>

namespace {

std::string encode(std::size_t v) {
	auto os = std::ostringstream();
	os << Solana::shortvec(v);
	return os.str();
}

bool decode(std::string const& s, std::uint16_t& v) {
	auto is = std::istringstream(s);
	is >> Solana::shortvec(v);
	return !is.fail();
}

}

int main() {
	assert(encode(0) == std::string("\x00", 1));
	assert(encode(0x7f) == "\x7f");
	assert(encode(0x80) == "\x80\x01");
	assert(encode(0xff) == "\xff\x01");
	assert(encode(0x100) == "\x80\x02");
	assert(encode(0x3fff) == "\xff\x7f");
	assert(encode(0x4000) == "\x80\x80\x01");
	assert(encode(0xffff) == "\xff\xff\x03");

	auto flag = false;
	try {
		encode(0x10000);
	} catch (std::length_error const&) {
		flag = true;
	}
	assert(flag);

	auto v = std::uint16_t();
	for (auto n : {0, 1, 0x7f, 0x80, 0x3fff, 0x4000, 0xffff}) {
		assert(decode(encode(n), v));
		assert(v == n);
	}

	/* Rejected prefixes.  */
	assert(!decode("", v));
	assert(!decode("\x80", v));
	assert(!decode(std::string("\x80\x00", 2), v));
	assert(!decode("\xff\xff\x04", v));
	assert(!decode("\x80\x80\x80", v));

	/* Stops after the prefix.  */
	auto is = std::istringstream("\x05rest");
	is >> Solana::shortvec(v);
	assert(v == 5);
	auto rest = std::string();
	is >> rest;
	assert(rest == "rest");

	return 0;
}
