#undef NDEBUG
#include"Build/Catalog.hpp"
#include"Build/Error.hpp"
#include<assert.h>
#include<sstream>

namespace {

std::string load_error(std::string const& csv) {
	auto is = std::istringstream(csv);
	try {
		Build::Catalog::load(is, "test.csv");
	} catch (Build::ConfigError const& e) {
		return e.what();
	}
	return "";
}

}

int main() {
	auto builtin = Build::Catalog::builtin();
	assert(builtin.size() > 0);
	assert(builtin.has("1.18.26"));
	for (auto const& v : builtin.versions())
		assert(Build::Catalog::valid_version(v));

	auto flag = false;
	try {
		builtin.select_image("9.9.9");
	} catch (Build::UnsupportedVersion const& e) {
		flag = true;
		assert(e.version == "9.9.9");
	}
	assert(flag);

	/* Extra columns, quoting, CRLF and blank lines.  */
	auto is = std::istringstream(
		"\n"
		"version,dockerfile_path,image\r\n"
		"1.14.23,docker/v1.14.23.Dockerfile,\"repo/img:1.14.23\"\r\n"
		"\n"
		"1.16.0, x , repo/img:1.16.0\n"
	);
	auto cat = Build::Catalog::load(is, "test.csv");
	assert(cat.size() == 2);
	assert(cat.select_image("1.14.23") == "repo/img:1.14.23");
	assert(cat.select_image("1.16.0") == "repo/img:1.16.0");
	assert((cat.versions() == std::vector<std::string>{"1.14.23", "1.16.0"}));

	/* Without an image column the public image is used.  */
	auto versions_only = std::istringstream(
		"version,dockerfile_path\n"
		"1.18.26,docker/v1.18.26.Dockerfile\n"
		"2.1.21,docker/v2.1.21.Dockerfile\n"
	);
	auto defaulted = Build::Catalog::load(versions_only, "test.csv");
	assert(defaulted.size() == 2);
	assert( defaulted.select_image("1.18.26")
	     == "solanafoundation/solana-verifiable-build:1.18.26"
	      );
	assert( defaulted.select_image("2.1.21")
	     == "solanafoundation/solana-verifiable-build:2.1.21"
	      );
	assert(load_error("version\n1.2\n") == "test.csv:2 (row 1): invalid version format '1.2'");

	/* Copies share the table.  */
	auto copy = cat;
	assert(&copy.select_image("1.14.23") == &cat.select_image("1.14.23"));

	/* Malformed catalogs.  */
	assert(load_error("") == "test.csv: empty catalog");
	assert(load_error("version,image\n") == "test.csv: catalog has no versions");
	assert(load_error("image\nimg\n") == "test.csv: missing 'version' column");
	assert( load_error("version,image\n1.2.3,\n")
	     == "test.csv:2 (row 1): missing required field 'image'"
	      );
	assert( load_error("version,image\n1.2,img\n")
	     == "test.csv:2 (row 1): invalid version format '1.2'"
	      );
	assert( load_error("version,image\n1.2.3,a\n1.2.3,b\n")
	     == "test.csv:3 (row 2): duplicate version '1.2.3'"
	      );

	assert(Build::Catalog::valid_version("1.14.23"));
	assert(!Build::Catalog::valid_version("1.14"));
	assert(!Build::Catalog::valid_version("1.14.x"));
	assert(!Build::Catalog::valid_version("1..2"));
	assert(!Build::Catalog::valid_version("v1.2.3"));
	assert(!Build::Catalog::valid_version("1.2.3."));

	flag = false;
	try {
		Build::Catalog::load_file("/nonexistent/catalog.csv");
	} catch (Build::ConfigError const&) {
		flag = true;
	}
	assert(flag);

	return 0;
}
