#include"Build/Cargo.hpp"
#include"Build/Error.hpp"
#include<sstream>
#include<toml++/toml.hpp>

namespace {

toml::table parse_manifest(std::istream& is, char const* what) {
	try {
		return toml::parse(is, what);
	} catch (toml::parse_error const& e) {
		auto os = std::ostringstream();
		os << what << ": " << e.description()
		   << " at line " << e.source().begin.line
		   ;
		throw Build::ConfigError(os.str());
	}
}

}

namespace Build { namespace Cargo {

std::string crate_name(std::istream& is) {
	auto tbl = parse_manifest(is, "Cargo.toml");

	auto name = tbl["lib"]["name"].value<std::string>();
	if (!name)
		name = tbl["package"]["name"].value<std::string>();
	if (!name)
		return "";

	auto rv = *name;
	for (auto& c : rv)
		if (c == '-')
			c = '_';
	return rv;
}

std::string solana_version(std::istream& is) {
	auto tbl = parse_manifest(is, "Cargo.lock");

	auto packages = tbl["package"].as_array();
	if (!packages)
		return "";

	for (auto const& wanted : {"solana-program", "solana-sdk"}) {
		for (auto& entry : *packages) {
			auto pkg = entry.as_table();
			if (!pkg)
				continue;
			if ((*pkg)["name"].value<std::string>() != wanted)
				continue;
			auto version = (*pkg)["version"].value<std::string>();
			if (version)
				return *version;
		}
	}
	return "";
}

}}
