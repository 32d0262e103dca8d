#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include<assert.h>
#include<sstream>

int main() {
	{
		auto s = Json::Out()
			.start_object()
				.field("number", 42)
			.end_object()
			.output()
			;

		auto is = std::istringstream(s);
		auto jsmn = Jsmn::Object();
		is >> jsmn;

		assert(jsmn.is_object());
		assert(jsmn.size() == 1);
		assert(jsmn.has("number"));
		assert(jsmn["number"].is_number());
		assert(((double)jsmn["number"]) == 42);
		assert(!jsmn.has("nonexistent"));
	}

	{
		auto s = Json::Out()
			.start_array()
				.start_object()
				.end_object()
				.entry(true)
			.end_array()
			.output()
			;

		auto is = std::istringstream(s);
		auto jsmn = Jsmn::Object();
		is >> jsmn;

		assert(jsmn.is_array());
		assert(jsmn.size() == 2);
		assert(jsmn[0].is_object());
		assert(jsmn[0].size() == 0);
		assert(jsmn[1].is_boolean());
		assert((bool)jsmn[1] == true);
	}

	{
		auto js = Json::Out();
		auto arr = js.start_array();
		for (auto i = 0; i < 8; ++i) {
			arr.entry(i);
		}
		arr.end_array();
		auto s = js.output();

		auto is = std::istringstream(s);
		auto jsmn = Jsmn::Object();
		is >> jsmn;

		assert(jsmn.is_array());
		assert(jsmn.size() == 8);
		for (auto i = 0; i < 8; ++i) {
			assert(jsmn[i].is_number());
			assert(((double)jsmn[i]) == i);
		}
	}

	{
		/* Nested documents, nulls and large integers.  */
		auto inner = Json::Out()
			.start_object()
				.field("digest", std::string(64, 'a'))
			.end_object()
			;
		auto s = Json::Out()
			.start_object()
				.field("artifact", inner)
				.field("upgrade_authority", nullptr)
				.field("slot", std::uint64_t(9007199254740993ULL))
				.start_object("attestation")
					.field("written", false)
				.end_object()
			.end_object()
			.output()
			;
		assert(s.find("9007199254740993") != std::string::npos);

		auto is = std::istringstream(s);
		auto jsmn = Jsmn::Object();
		is >> jsmn;

		assert(jsmn.size() == 4);
		assert(jsmn["artifact"].is_object());
		assert(std::string(jsmn["artifact"]["digest"]) == std::string(64, 'a'));
		assert(jsmn.has("upgrade_authority"));
		assert(jsmn["upgrade_authority"].is_null());
		assert(jsmn["attestation"]["written"].is_boolean());
		assert(!bool(jsmn["attestation"]["written"]));
	}

	return 0;
}
