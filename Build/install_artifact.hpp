#ifndef BUILD_INSTALL_ARTIFACT_HPP
#define BUILD_INSTALL_ARTIFACT_HPP

#include<string>

namespace Build { struct Artifact; }

namespace Build {

/** Build::install_artifact
 *
 * @brief copy the artifact to
 * `<crate_dir>/target/deploy/<binary_name>.so`,
 * creating directories as needed.
 *
 * @return the path written.
 *
 * @desc Throws `Build::BuildFailure` if the copy
 * cannot be made.
 */
std::string install_artifact( Build::Artifact const& artifact
			    , std::string const& crate_dir
			    );

}

#endif /* !defined(BUILD_INSTALL_ARTIFACT_HPP) */
