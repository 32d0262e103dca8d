#ifndef BUILD_ERROR_HPP
#define BUILD_ERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Build {

/** class Build::ConfigError
 *
 * @brief thrown when the build inputs or the
 * image catalog are invalid.
 *
 * @desc Raised before any build is attempted and
 * never retried.
 */
class ConfigError : public Util::BacktraceException<std::runtime_error> {
public:
	ConfigError(std::string const& msg
		   ) : Util::BacktraceException<std::runtime_error>(msg) { }
};

/** class Build::UnsupportedVersion
 *
 * @brief thrown when a toolchain version has no
 * image in the catalog.
 */
class UnsupportedVersion : public ConfigError {
public:
	std::string const version;

	explicit
	UnsupportedVersion(std::string const& version_
			  ) : ConfigError( "Unsupported toolchain version: "
					 + version_
					 )
			    , version(version_)
			    { }
};

/** class Build::BuildFailure
 *
 * @brief thrown when the containerized build did
 * not produce an artifact.
 *
 * @desc `exit_code` is the container exit code, or
 * -1 if the container was killed (timeout or
 * interrupt) or never ran.
 * `log_tail` holds the last lines of the combined
 * build output.
 */
class BuildFailure : public Util::BacktraceException<std::runtime_error> {
public:
	int const exit_code;
	std::string const log_tail;

	BuildFailure( std::string const& msg
		    , int exit_code_
		    , std::string log_tail_
		    ) : Util::BacktraceException<std::runtime_error>(msg)
		      , exit_code(exit_code_)
		      , log_tail(std::move(log_tail_))
		      { }
};

}

#endif /* !defined(BUILD_ERROR_HPP) */
