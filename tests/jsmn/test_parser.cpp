#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include<assert.h>
#include<sstream>
#include<string>

int main() {
	Jsmn::Parser p;

	/* A response body delivered in pieces, the way a
	 * transfer hands it over.  */
	{
		auto res = p.feed(R"JSON({"jsonrpc":"2.0","result":{"con)JSON");
		assert(res.size() == 0);
	}
	{
		auto res = p.feed(R"JSON(text":{"slot":341},"value":nu)JSON");
		assert(res.size() == 0);
	}
	{
		auto res = p.feed("ll},\"id\":7}\n");
		assert(res.size() == 1);
		auto const& r = res[0];
		assert(r.is_object());
		assert(r["result"]["context"]["slot"].is_number());
		assert(double(r["result"]["context"]["slot"]) == 341);
		assert(r["result"].has("value"));
		assert(r["result"]["value"].is_null());
		assert(!r["result"]["missing"]);
		assert(double(r["id"]) == 7);
	}

	/* A number is only complete once something
	 * follows it.  */
	{
		auto res = p.feed("12");
		assert(res.size() == 0);
	}
	{
		auto res = p.feed("8 ");
		assert(res.size() == 1);
		assert(res[0].is_number());
		assert(double(res[0]) == 128);
	}

	/* Several documents in one feed.  */
	{
		auto res = p.feed(R"JSON("queued" "building" [] {})JSON");
		assert(res.size() == 4);
		assert(std::string(res[0]) == "queued");
		assert(std::string(res[1]) == "building");
		assert(res[2].is_array());
		assert(res[2].size() == 0);
		assert(res[3].is_object());
		assert(res[3].keys().empty());
	}

	/* Brackets and escapes inside strings do not
	 * confuse nesting.  */
	{
		auto res = p.feed(R"JSON(
			{ "log_tail": "error[E0425]: cannot find value `x`\n  --> src/lib.rs:3:5 }\"]"
			, "args": [ "--features", "{no-entrypoint}" ]
			}
		)JSON");
		assert(res.size() == 1);
		auto tail = std::string(res[0]["log_tail"]);
		assert(tail.find("error[E0425]") == 0);
		assert(tail.find('\n') != std::string::npos);
		assert(tail.substr(tail.size() - 3) == "}\"]");
		assert(res[0]["args"].size() == 2);
		assert(std::string(res[0]["args"][1]) == "{no-entrypoint}");
	}

	/* Base64 account data as a two-element array.  */
	{
		auto res = p.feed(R"JSON({"data":["AgAAAA==","base64"],"executable":true})JSON");
		assert(res.size() == 1);
		assert(res[0]["data"].is_array());
		assert(std::string(res[0]["data"][0]) == "AgAAAA==");
		assert(std::string(res[0]["data"][1]) == "base64");
		assert(res[0]["executable"].is_boolean());
		assert(bool(res[0]["executable"]));
	}

	/* RPC errors are echoed back in messages.  */
	{
		auto res = p.feed(R"JSON({"code":-32602,"message":"bad \"param\"","data":[1,null]})JSON");
		assert(res.size() == 1);
		auto os = std::ostringstream();
		os << res[0];
		assert(os.str() == "{\n"
				   "\t\"code\" : -32602,\n"
				   "\t\"message\" : \"bad \\\"param\\\"\",\n"
				   "\t\"data\" : [\n"
				   "\t\t1,\n"
				   "\t\tnull\n"
				   "\t]\n"
				   "}");
	}

	return 0;
}
