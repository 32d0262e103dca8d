#undef NDEBUG
#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Sha256/fun.hpp"
#include<assert.h>
#include<unordered_set>

namespace {
auto const hello = std::string("2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

int main() {
	/* From sha256sum.  */
	assert(Sha256::fun("hello", 5) == Sha256::Hash(hello));
	assert(std::string(Sha256::fun(std::string("hello"))) == hello);
	assert( std::string(Sha256::fun("", 0))
	     == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"
	      );

	/* Incremental feeding.  */
	auto hasher = Sha256::Hasher();
	hasher.feed("hel", 3);
	auto copy = hasher;
	hasher.feed("lo", 2);
	assert(hasher.get() == Sha256::Hash(hello));
	assert(std::move(hasher).finalize() == Sha256::Hash(hello));
	assert(!hasher);
	copy.feed("p", 1);
	assert(std::move(copy).finalize() == Sha256::fun("help", 4));

	/* Hash values.  */
	auto a = Sha256::Hash();
	auto b = Sha256::Hash();
	assert(a == b);
	assert(!a);
	b = Sha256::Hash(hello);
	assert(a != b);
	assert(b);
	assert(!Sha256::Hash::valid_string("2cf24dba"));
	assert(!Sha256::Hash::valid_string(hello.substr(0, 63) + "g"));
	assert(!Sha256::Hash("0000000000000000000000000000000000000000000000000000000000000000"));

	auto bag = std::unordered_set<Sha256::Hash>();
	bag.insert(Sha256::fun("hello", 5));
	bag.insert(b);
	assert(bag.size() == 1);

	std::uint8_t buf[32];
	b.to_buffer(buf);
	a.from_buffer(buf);
	assert(a == b);

	return 0;
}
