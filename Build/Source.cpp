#include"Build/Cargo.hpp"
#include"Build/Error.hpp"
#include"Build/OutputDir.hpp"
#include"Build/Source.hpp"
#include"Build/Target.hpp"
#include"Ev/Io.hpp"
#include"Ev/coroutine.hpp"
#include"Ev/runcmd.hpp"
#include"Reprove/log.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include<fstream>
#include<sys/stat.h>
#include<vector>

namespace {

/* Runs git without ever prompting for credentials.  */
Ev::Io<Ev::RunCmdResult> git(std::vector<std::string> args) {
	auto argv = std::vector<std::string>{
		"GIT_TERMINAL_PROMPT=0", "git"
	};
	argv.insert(argv.end(), args.begin(), args.end());
	return Ev::runcmd_status("env", std::move(argv), true);
}

void check_git( Ev::RunCmdResult const& res
	      , std::string const& what
	      ) {
	if (res.exit_code == 0)
		return;
	throw Build::BuildFailure( "git " + what + " failed"
				 , res.exit_code
				 , res.output
				 );
}

std::string crate_dir( Build::Target const& target
		     , Build::Source const& source
		     ) {
	if (target.crate_subpath.empty())
		return source.root;
	return source.root + "/" + target.crate_subpath;
}

}

namespace Build {

bool is_local_source(std::string const& repo_url) {
	struct stat st;
	if (stat(repo_url.c_str(), &st) < 0)
		return false;
	return S_ISDIR(st.st_mode);
}

Ev::Io<Source> prepare_source( S::Bus& bus
			     , Build::Target const& target
			     , std::string workdir
			     ) {
	auto rv = Source();

	if (is_local_source(target.repo_url)) {
		/* The container runtime wants absolute mount
		 * sources.  */
		rv.root = absolute_path(target.repo_url);
		if (!target.commit_ref.empty())
			co_await Reprove::log( bus, Reprove::Warn
					     , "Build: local source %s used "
					       "as is, ignoring commit %s"
					     , rv.root.c_str()
					     , target.commit_ref.c_str()
					     );
		/* Not being a git checkout is fine here.  */
		auto head_args = std::vector<std::string>{ "-C", rv.root
							 , "rev-parse", "HEAD"
							 };
		auto head = co_await git(std::move(head_args));
		if (head.exit_code == 0)
			rv.commit = Util::Str::trim(head.output);
	} else {
		rv.root = workdir + "/src";
		co_await Reprove::log( bus, Reprove::Info
				     , "Build: cloning %s"
				     , target.repo_url.c_str()
				     );
		auto clone_args = std::vector<std::string>{ "clone", "--quiet"
							  , "--", target.repo_url, rv.root
							  };
		auto clone = co_await git(std::move(clone_args));
		check_git(clone, "clone of " + target.repo_url);
		rv.root = absolute_path(rv.root);

		if (!target.commit_ref.empty()) {
			auto checkout_args = std::vector<std::string>{ "-C", rv.root
								     , "checkout", "--quiet"
								     , target.commit_ref
								     };
			auto checkout = co_await git(std::move(checkout_args));
			check_git(checkout, "checkout of " + target.commit_ref);
		}

		auto head_args = std::vector<std::string>{ "-C", rv.root
							 , "rev-parse", "HEAD"
							 };
		auto head = co_await git(std::move(head_args));
		check_git(head, "rev-parse");
		rv.commit = Util::Str::trim(head.output);
	}

	if (!rv.commit.empty())
		co_await Reprove::log( bus, Reprove::Info
				     , "Build: source at commit %s"
				     , rv.commit.c_str()
				     );
	co_return rv;
}

std::string resolve_binary_name( Build::Target const& target
			       , Source const& source
			       ) {
	if (!target.binary_name.empty())
		return target.binary_name;

	auto path = crate_dir(target, source) + "/Cargo.toml";
	auto is = std::ifstream(path);
	if (!is)
		throw ConfigError( "Cannot read " + path
				 + ", give the library name explicitly"
				 );
	auto name = Cargo::crate_name(is);
	if (name.empty())
		throw ConfigError("No crate name in " + path);
	return name;
}

std::string resolve_toolchain_version( Build::Target const& target
				     , Source const& source
				     ) {
	if (!target.toolchain_version.empty())
		return target.toolchain_version;

	/* Workspaces keep the lock file at the root.  */
	for (auto const& dir : { crate_dir(target, source), source.root }) {
		auto is = std::ifstream(dir + "/Cargo.lock");
		if (!is)
			continue;
		auto version = Cargo::solana_version(is);
		if (!version.empty())
			return version;
	}
	throw ConfigError( "Cannot determine the Solana version from "
			   "Cargo.lock, give it explicitly"
			 );
}

}
