#ifndef BUILD_SOURCE_HPP
#define BUILD_SOURCE_HPP

#include<string>

namespace Build { struct Target; }
namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Build {

/** struct Build::Source
 *
 * @brief a source tree ready to be mounted into a
 * build container.
 *
 * @desc `commit` is the resolved commit hash, or
 * empty if the tree is a local directory outside
 * of git.
 */
struct Source {
	std::string root;
	std::string commit;
};

/** Build::is_local_source
 *
 * @brief determines if the repository of the target
 * names an existing local directory.
 */
bool is_local_source(std::string const& repo_url);

/** Build::prepare_source
 *
 * @brief makes the target's source tree available
 * on the host.
 *
 * @desc A local directory is used as is, with
 * `root` resolved to an absolute path.
 * Otherwise the repository is cloned under `workdir`
 * and the target's commit is checked out.
 * The resolved commit hash is logged.
 *
 * Throws `Build::BuildFailure` if git fails.
 */
Ev::Io<Source> prepare_source( S::Bus& bus
			     , Build::Target const& target
			     , std::string workdir
			     );

/** Build::resolve_binary_name
 *
 * @brief returns the target's binary name, or
 * reads it from the crate's `Cargo.toml`.
 *
 * @desc Throws `Build::ConfigError` if no name can
 * be determined.
 */
std::string resolve_binary_name( Build::Target const& target
			       , Source const& source
			       );

/** Build::resolve_toolchain_version
 *
 * @brief returns the target's toolchain version,
 * or reads the locked Solana version from the
 * source's `Cargo.lock`.
 *
 * @desc Throws `Build::ConfigError` if no version
 * can be determined.
 */
std::string resolve_toolchain_version( Build::Target const& target
				     , Source const& source
				     );

}

#endif /* !defined(BUILD_SOURCE_HPP) */
