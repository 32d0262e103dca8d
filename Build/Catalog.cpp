#include"Build/Catalog.hpp"
#include"Build/Error.hpp"
#include"Util/Str.hpp"
#include"Util/format.hpp"
#include<algorithm>
#include<fstream>
#include<sstream>

namespace {

auto const builtin_versions = std::vector<std::string>
{ "1.14.29"
, "1.16.27"
, "1.17.34"
, "1.18.26"
, "2.0.25"
, "2.1.21"
, "2.2.14"
};

auto const builtin_repository = std::string(
	"solanafoundation/solana-verifiable-build"
);

/* Splits one CSV record.
 * Double-quoted fields may contain commas and
 * doubled quotes; records do not span lines.  */
std::vector<std::string> split_record(std::string const& line) {
	auto rv = std::vector<std::string>();
	auto field = std::string();
	auto quoted = false;
	for (auto i = std::size_t(0); i < line.size(); ++i) {
		auto c = line[i];
		if (quoted) {
			if (c == '"') {
				if (i + 1 < line.size() && line[i + 1] == '"') {
					field.push_back('"');
					++i;
				} else
					quoted = false;
			} else
				field.push_back(c);
		} else if (c == '"')
			quoted = true;
		else if (c == ',') {
			rv.push_back(Util::Str::trim(field));
			field.clear();
		} else
			field.push_back(c);
	}
	rv.push_back(Util::Str::trim(field));
	return rv;
}

std::size_t find_column( std::vector<std::string> const& header
		       , std::string const& name
		       , std::string const& source
		       ) {
	auto it = std::find(header.begin(), header.end(), name);
	if (it == header.end())
		throw Build::ConfigError(
			source + ": missing '" + name + "' column"
		);
	return std::size_t(it - header.begin());
}

}

namespace Build {

Catalog::Catalog(std::map<std::string, std::string> images_)
	: images(std::make_shared<std::map<std::string, std::string> const>(
		std::move(images_)
	  )) { }

Catalog Catalog::builtin() {
	auto images = std::map<std::string, std::string>();
	for (auto const& v : builtin_versions)
		images[v] = builtin_repository + ":" + v;
	return Catalog(std::move(images));
}

Catalog Catalog::load(std::istream& is, std::string const& source) {
	auto line = std::string();
	auto lineno = std::size_t(0);

	/* Header, skipping blank lines.  */
	auto header = std::vector<std::string>();
	while (std::getline(is, line)) {
		++lineno;
		if (!line.empty() && line.back() == '\r')
			line.pop_back();
		if (Util::Str::trim(line).empty())
			continue;
		header = split_record(line);
		break;
	}
	if (header.empty())
		throw ConfigError(source + ": empty catalog");

	auto version_col = find_column(header, "version", source);
	/* Without an image column, every version uses
	 * the public verifiable-build image.  */
	auto has_image = std::find( header.begin(), header.end()
				  , "image"
				  ) != header.end();
	auto image_col = has_image
		       ? find_column(header, "image", source)
		       : std::size_t(0)
		       ;

	auto images = std::map<std::string, std::string>();
	auto row = std::size_t(0);
	while (std::getline(is, line)) {
		++lineno;
		if (!line.empty() && line.back() == '\r')
			line.pop_back();
		if (Util::Str::trim(line).empty())
			continue;
		++row;
		auto where = Util::format( "%s:%zu (row %zu)"
					 , source.c_str(), lineno, row
					 );

		auto fields = split_record(line);
		auto get = [&](std::size_t col, char const* name) {
			if (col >= fields.size() || fields[col].empty())
				throw ConfigError( where
						 + ": missing required field '"
						 + name + "'"
						 );
			return fields[col];
		};
		auto version = get(version_col, "version");
		auto image = has_image
			   ? get(image_col, "image")
			   : builtin_repository + ":" + version
			   ;

		if (!valid_version(version))
			throw ConfigError( where
					 + ": invalid version format '"
					 + version + "'"
					 );
		if (images.count(version) != 0)
			throw ConfigError( where
					 + ": duplicate version '"
					 + version + "'"
					 );
		images[version] = image;
	}

	if (images.empty())
		throw ConfigError(source + ": catalog has no versions");
	return Catalog(std::move(images));
}

Catalog Catalog::load_file(std::string const& path) {
	auto is = std::ifstream(path);
	if (!is)
		throw ConfigError("Cannot open image catalog: " + path);
	return load(is, path);
}

std::string const& Catalog::select_image(std::string const& version) const {
	auto it = images->find(version);
	if (it == images->end())
		throw UnsupportedVersion(version);
	return it->second;
}

bool Catalog::has(std::string const& version) const {
	return images->count(version) != 0;
}

std::vector<std::string> Catalog::versions() const {
	auto rv = std::vector<std::string>();
	for (auto const& e : *images)
		rv.push_back(e.first);
	return rv;
}

bool Catalog::valid_version(std::string const& s) {
	auto parts = std::size_t(0);
	auto digits = std::size_t(0);
	for (auto c : s) {
		if (c == '.') {
			if (digits == 0)
				return false;
			++parts;
			digits = 0;
		} else if ('0' <= c && c <= '9')
			++digits;
		else
			return false;
	}
	return parts == 2 && digits != 0;
}

}
