#ifndef BUILD_TARGET_HPP
#define BUILD_TARGET_HPP

#include<map>
#include<string>
#include<vector>

namespace Build {

/** struct Build::Target
 *
 * @brief the declared inputs of a build.
 *
 * @desc Immutable once constructed.
 * Together with the image, these fully determine
 * the build output.
 *
 * `repo_url` may name a remote git repository or a
 * local directory.
 * `commit_ref`, `crate_subpath` and `binary_name`
 * may be empty, meaning the default branch, the
 * repository root, and the crate's own name
 * respectively.
 * `toolchain_version` may be empty only if the
 * caller resolves the image some other way.
 *
 * The constructor throws `Build::ConfigError` on
 * invalid build flags, an empty `repo_url`, or a
 * `commit_ref` that starts with `-`.
 */
struct Target {
	std::string const toolchain_version;
	std::string const repo_url;
	std::string const commit_ref;
	std::string const crate_subpath;
	std::string const binary_name;
	/* Ordered by key, keys unique.  */
	std::map<std::string, std::string> const build_flags;

	Target( std::string toolchain_version_
	      , std::string repo_url_
	      , std::string commit_ref_ = ""
	      , std::string crate_subpath_ = ""
	      , std::string binary_name_ = ""
	      , std::map<std::string, std::string> build_flags_ = {}
	      );
	Target(Target const&) =default;
	Target(Target&&) =default;

	/* Returns a copy with a different toolchain
	 * version.  */
	Target with_toolchain_version(std::string) const;

	/* The trailing arguments passed to the build
	 * command, in key order.  */
	std::vector<std::string> flag_arguments() const;

	static bool valid_flag_key(std::string const&);
	static bool valid_flag_value(std::string const&);
};

}

#endif /* !defined(BUILD_TARGET_HPP) */
