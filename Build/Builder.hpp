#ifndef BUILD_BUILDER_HPP
#define BUILD_BUILDER_HPP

#include"Build/BuilderIF.hpp"
#include"Digest/Policy.hpp"
#include<cstddef>
#include<memory>
#include<string>
#include<vector>

namespace Build { class Catalog; }
namespace Reprove { namespace Mod { class Waiter; }}
namespace S { class Bus; }

namespace Build {

/** class Build::Builder
 *
 * @brief runs reproducible builds in containers.
 *
 * @desc Each build gets its own directory under
 * `workdir`, holding the cloned source (if the
 * source is not local) and the single writable
 * output directory mounted into the container.
 * The container runs with a normalized environment
 * and a fixed command line; the host environment
 * is not forwarded.
 *
 * On timeout or on `Reprove::Shutdown` the
 * container is forcibly removed.
 */
class Builder : public BuilderIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Builder() =delete;
	Builder(Builder const&) =delete;

	Builder( S::Bus& bus
	       , Reprove::Mod::Waiter& waiter
	       , Build::Catalog const& catalog
	       /* Container runtime command.  */
	       , std::string docker
	       , std::string workdir
	       , Digest::Policy policy = Digest::Policy()
	       );
	~Builder();

	Ev::Io<Build::Artifact> build( Build::Target const& target
				     , std::string image
				     , double timeout
				     ) override;

	/* Arguments given to the container runtime, exposed
	 * for testing.  */
	static
	std::vector<std::string>
	container_arguments( std::string const& name
			   , std::string const& source_root
			   , std::string const& output_dir
			   , std::string const& image
			   , Build::Target const& target
			   );
};

/** Build::log_tail
 *
 * @brief returns the last `lines` lines of the
 * given output.
 */
std::string log_tail(std::string const& output, std::size_t lines = 40);

}

#endif /* !defined(BUILD_BUILDER_HPP) */
