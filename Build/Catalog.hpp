#ifndef BUILD_CATALOG_HPP
#define BUILD_CATALOG_HPP

#include<iostream>
#include<map>
#include<memory>
#include<string>
#include<vector>

namespace Build {

/** class Build::Catalog
 *
 * @brief immutable mapping from toolchain version
 * to container image reference.
 *
 * @desc Constructed once at process start, then
 * passed around by reference.
 * Copies share the same underlying table.
 */
class Catalog {
private:
	std::shared_ptr<std::map<std::string, std::string> const> images;

	explicit
	Catalog(std::map<std::string, std::string> images_);

public:
	Catalog() =delete;
	Catalog(Catalog const&) =default;
	Catalog(Catalog&&) =default;
	~Catalog() =default;

	/** Build::Catalog::builtin
	 *
	 * @brief the table of published verifiable-build
	 * images.
	 */
	static Catalog builtin();

	/** Build::Catalog::load
	 *
	 * @brief reads a CSV catalog with a header row
	 * naming at least the `version` column.
	 * Without an `image` column, each version maps
	 * to `solanafoundation/solana-verifiable-build:<version>`.
	 * Other columns are ignored.
	 *
	 * @desc Throws `Build::ConfigError` on empty
	 * required fields, malformed versions, and
	 * duplicate versions.
	 * `source` names the input in error messages.
	 */
	static Catalog load(std::istream& is, std::string const& source);
	/* Like `load`, but opens the named file.  */
	static Catalog load_file(std::string const& path);

	/** Build::Catalog::select_image
	 *
	 * @brief returns the image for the version, or
	 * throws `Build::UnsupportedVersion`.
	 */
	std::string const& select_image(std::string const& version) const;

	bool has(std::string const& version) const;
	std::vector<std::string> versions() const;
	std::size_t size() const { return images->size(); }

	/* Checks for the `MAJOR.MINOR.PATCH` form with
	 * numeric parts.  */
	static bool valid_version(std::string const&);
};

}

#endif /* !defined(BUILD_CATALOG_HPP) */
