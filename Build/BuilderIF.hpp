#ifndef BUILD_BUILDERIF_HPP
#define BUILD_BUILDERIF_HPP

#include<string>

namespace Build { struct Artifact; }
namespace Build { struct Target; }
namespace Ev { template<typename a> class Io; }

namespace Build {

/** class Build::BuilderIF
 *
 * @brief interface to an object that builds a
 * target into a binary artifact.
 */
class BuilderIF {
public:
	virtual ~BuilderIF() { }

	/** Build::BuilderIF::build
	 *
	 * @brief builds the target inside the given
	 * image, giving up after `timeout` seconds.
	 *
	 * @desc An empty `image` means the image is
	 * selected from the catalog by the target's
	 * toolchain version, or the version locked in
	 * the source when the target has none.
	 *
	 * Throws `Build::BuildFailure` or
	 * `Build::ConfigError`.
	 */
	virtual
	Ev::Io<Build::Artifact> build( Build::Target const& target
				     , std::string image
				     , double timeout
				     ) =0;
};

}

#endif /* !defined(BUILD_BUILDERIF_HPP) */
