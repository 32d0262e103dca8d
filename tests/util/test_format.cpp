#undef NDEBUG
#include"Util/format.hpp"
#include<assert.h>
#include<cstdint>
#include<string>

int main() {
	assert(Util::format("verified") == "verified");
	assert(Util::format("exit %d", 2) == "exit 2");
	assert(Util::format("slot %llu", (unsigned long long) 250000000000ULL)
	       == "slot 250000000000");
	assert(Util::format("backoff %0.1fs", 2.0) == "backoff 2.0s");
	assert(Util::format("job %s is %s", "job-42", "building")
	       == "job job-42 is building");

	/* Longer than any fixed first buffer.  */
	auto tail = std::string(3000, 'x');
	auto s = Util::format("tail: %s", tail.c_str());
	assert(s.size() == 3006);
	assert(s.substr(0, 6) == "tail: ");

	return 0;
}
