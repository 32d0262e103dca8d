#undef NDEBUG
#include"Build/Cargo.hpp"
#include"Build/Error.hpp"
#include<assert.h>
#include<sstream>

namespace {

std::string name_of(std::string const& toml) {
	auto is = std::istringstream(toml);
	return Build::Cargo::crate_name(is);
}
std::string version_of(std::string const& lock) {
	auto is = std::istringstream(lock);
	return Build::Cargo::solana_version(is);
}

bool name_rejected(std::string const& toml) {
	try {
		(void) name_of(toml);
	} catch (Build::ConfigError const&) {
		return true;
	}
	return false;
}

}

int main() {
	assert(name_of("[package]\nname = \"my-program\"\n") == "my_program");
	assert(name_of( "[package]\nname = \"pkg\" # comment\n"
			"[dependencies]\nserde = \"1\"\n"
			"[lib]\ncrate-type = [\"cdylib\"]\nname = \"lib-name\"\n"
		      ) == "lib_name");
	assert(name_of("[workspace]\nmembers = [\"a\"]\n") == "");
	assert(name_of("[package]\nname = \"has#hash\"\n") == "has#hash");

	/* Literal strings and spaced headers are plain TOML,
	 * and the [lib] name still wins.  */
	assert(name_of( "[package]\nname = \"my-crate\"\n"
			"[lib]\nname = 'custom_lib'\n"
		      ) == "custom_lib");
	assert(name_of( "[package]\nname = \"my-crate\"\n"
			"[ lib ]\nname = \"other\"\n"
		      ) == "other");
	assert(name_of( "package = { name = \"inline-pkg\" }\n"
		      ) == "inline_pkg");

	/* Broken manifests are configuration errors, not a
	 * silent fallback.  */
	assert(name_rejected("[package\nname = \"x\"\n"));
	assert(name_rejected("[package]\nname = \"x\"\nname = \"y\"\n"));

	assert(version_of( "version = 3\n"
			   "[[package]]\nname = \"solana-sdk\"\nversion = \"1.17.3\"\n"
			   "[[package]]\nname = \"solana-program\"\nversion = \"1.18.26\"\n"
			 ) == "1.18.26");
	assert(version_of( "[[package]]\nname = \"solana-sdk\"\nversion = \"1.17.3\"\n"
			 ) == "1.17.3");
	assert(version_of( "[[package]]\nname = 'solana-program'\n"
			   "version = '2.1.0'\n"
			   "dependencies = [\n \"borsh\",\n]\n"
			 ) == "2.1.0");
	assert(version_of( "[[package]]\nname = \"serde\"\nversion = \"1.0.0\"\n"
			 ) == "");
	assert(version_of("version = 3\n") == "");

	return 0;
}
