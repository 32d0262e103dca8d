#include"Build/Artifact.hpp"
#include"Build/Builder.hpp"
#include"Build/Catalog.hpp"
#include"Build/Error.hpp"
#include"Build/Source.hpp"
#include"Build/Target.hpp"
#include"Digest/canonicalize_and_hash.hpp"
#include"Digest/read_file.hpp"
#include"Ev/Io.hpp"
#include"Ev/coroutine.hpp"
#include"Ev/runcmd.hpp"
#include"Reprove/Mod/Waiter.hpp"
#include"Reprove/Shutdown.hpp"
#include"Reprove/log.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Uuid.hpp"
#include<errno.h>
#include<string.h>
#include<sys/stat.h>
#include<sys/types.h>

namespace {

void make_dir(std::string const& path) {
	if (mkdir(path.c_str(), 0755) < 0)
		throw Build::ConfigError( "Cannot create directory "
					+ path + ": " + strerror(errno)
					);
}

}

namespace Build {

std::string log_tail(std::string const& output, std::size_t lines) {
	auto end = output.size();
	/* A trailing newline does not start another line.  */
	if (end > 0 && output[end - 1] == '\n')
		--end;
	auto start = end;
	auto count = std::size_t(0);
	while (start > 0) {
		if (output[start - 1] == '\n') {
			++count;
			if (count == lines)
				break;
		}
		--start;
	}
	return output.substr(start, end - start);
}

std::vector<std::string>
Builder::container_arguments( std::string const& name
			    , std::string const& source_root
			    , std::string const& output_dir
			    , std::string const& image
			    , Build::Target const& target
			    ) {
	auto workdir = std::string("/build");
	if (!target.crate_subpath.empty())
		workdir += "/" + target.crate_subpath;

	auto rv = std::vector<std::string>
	{ "run", "--rm"
	, "--name", name
	, "-v", source_root + ":/build:ro"
	, "-v", output_dir + ":/out"
	, "-w", workdir
	, "-e", "LC_ALL=C"
	, "-e", "LANG=C"
	, "-e", "TZ=UTC"
	, "-e", "SOURCE_DATE_EPOCH=0"
	, "-e", "CARGO_INCREMENTAL=0"
	, "-e", "CARGO_TERM_COLOR=never"
	, "-e", "CARGO_TARGET_DIR=/out/target"
	, image
	, "cargo", "build-sbf"
	, "--sbf-out-dir", "/out/deploy"
	, "--", "--locked"
	};
	auto flags = target.flag_arguments();
	rv.insert(rv.end(), flags.begin(), flags.end());
	return rv;
}

class Builder::Impl {
private:
	S::Bus& bus;
	Reprove::Mod::Waiter& waiter;
	Build::Catalog const& catalog;
	std::string docker;
	std::string workdir;
	Digest::Policy policy;

	Ev::Io<void> kill_container(std::string name) {
		auto rm_args = std::vector<std::string>{"rm", "-f", name};
		auto res = co_await Ev::runcmd_status( docker
						     , std::move(rm_args)
						     , true
						     );
		if (res.exit_code != 0)
			co_await Reprove::log( bus, Reprove::Error
					     , "Build: could not remove "
					       "container %s: %s"
					     , name.c_str()
					     , res.output.c_str()
					     );
		else
			co_await Reprove::log( bus, Reprove::Info
					     , "Build: removed container %s"
					     , name.c_str()
					     );
		co_return;
	}

public:
	Impl( S::Bus& bus_
	    , Reprove::Mod::Waiter& waiter_
	    , Build::Catalog const& catalog_
	    , std::string docker_
	    , std::string workdir_
	    , Digest::Policy policy_
	    ) : bus(bus_)
	      , waiter(waiter_)
	      , catalog(catalog_)
	      , docker(std::move(docker_))
	      , workdir(std::move(workdir_))
	      , policy(policy_)
	      { }

	Ev::Io<Build::Artifact> build( Build::Target target
				     , std::string image
				     , double timeout
				     ) {
		/* Fail fast on a known-unsupported version.  */
		if (image.empty() && !target.toolchain_version.empty())
			image = catalog.select_image(target.toolchain_version);

		auto id = std::string(Uuid::random());
		auto dir = workdir + "/build-" + id.substr(0, 12);
		make_dir(dir);

		auto source = co_await Build::prepare_source(bus, target, dir);
		auto binary_name = resolve_binary_name(target, source);
		if (image.empty()) {
			auto version = resolve_toolchain_version(target, source);
			co_await Reprove::log( bus, Reprove::Info
					     , "Build: toolchain %s from Cargo.lock"
					     , version.c_str()
					     );
			image = catalog.select_image(version);
		}

		auto out = dir + "/out";
		make_dir(out);

		auto name = "reprove-" + id;
		auto args = container_arguments( name, source.root, out
					       , image, target
					       );
		co_await Reprove::log( bus, Reprove::Info
				     , "Build: building %s in %s"
				     , binary_name.c_str()
				     , image.c_str()
				     );

		auto result = Ev::RunCmdResult{-1, ""};
		auto timed_out = false;
		auto interrupted = false;
		auto launch_error = std::string();
		try {
			result = co_await waiter.timed(
				timeout,
				Ev::runcmd_status(docker, args, true)
			);
		} catch (Reprove::Mod::Waiter::TimedOut const&) {
			timed_out = true;
		} catch (Reprove::Shutdown const&) {
			interrupted = true;
		} catch (Ev::RunCmdError const& e) {
			launch_error = e.what();
		}

		if (!launch_error.empty())
			throw BuildFailure( "Cannot run container runtime: "
					  + launch_error
					  , -1, ""
					  );
		if (timed_out || interrupted) {
			co_await kill_container(name);
			if (interrupted)
				throw Reprove::Shutdown();
			throw BuildFailure( "Build timed out after "
					  + std::to_string(long(timeout))
					  + " seconds"
					  , -1, ""
					  );
		}

		if (result.exit_code != 0) {
			auto tail = log_tail(result.output);
			co_await Reprove::log( bus, Reprove::Error
					     , "Build: container exited with "
					       "code %d"
					     , result.exit_code
					     );
			throw BuildFailure( "Build failed with exit code "
					  + std::to_string(result.exit_code)
					  , result.exit_code
					  , std::move(tail)
					  );
		}
		co_await Reprove::log( bus, Reprove::Debug
				     , "Build: output: %s"
				     , log_tail(result.output).c_str()
				     );

		auto path = out + "/deploy/" + binary_name + ".so";
		auto bytes = std::vector<std::uint8_t>();
		try {
			bytes = Digest::read_file(path);
		} catch (Digest::ReadError const&) {
			throw BuildFailure( "Build produced no artifact at "
					  + path
					  , 0
					  , log_tail(result.output)
					  );
		}

		auto rv = Build::Artifact();
		rv.raw_path = path;
		rv.size = bytes.size();
		rv.digest = Digest::canonicalize_and_hash( std::move(bytes)
							 , policy
							 ).digest;
		rv.binary_name = binary_name;
		rv.image = image;
		rv.commit = source.commit;

		co_await Reprove::log( bus, Reprove::Info
				     , "Build: %s is %llu bytes, digest %s"
				     , path.c_str()
				     , (unsigned long long) rv.size
				     , std::string(rv.digest).c_str()
				     );
		co_return rv;
	}
};

Builder::Builder( S::Bus& bus
		, Reprove::Mod::Waiter& waiter
		, Build::Catalog const& catalog
		, std::string docker
		, std::string workdir
		, Digest::Policy policy
		) : pimpl(Util::make_unique<Impl>( bus, waiter, catalog
						 , std::move(docker)
						 , std::move(workdir)
						 , policy
						 ))
		  { }
Builder::~Builder() =default;

Ev::Io<Build::Artifact> Builder::build( Build::Target const& target
				      , std::string image
				      , double timeout
				      ) {
	return pimpl->build(target, std::move(image), timeout);
}

}
