#include"Build/Builder.hpp"
#include"Build/Catalog.hpp"
#include"Build/Error.hpp"
#include"Build/OutputDir.hpp"
#include"Build/Target.hpp"
#include"Build/install_artifact.hpp"
#include"Digest/canonicalize_and_hash.hpp"
#include"Digest/read_file.hpp"
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/coroutine.hpp"
#include"Ev/yield.hpp"
#include"Http/Connection.hpp"
#include"Remote/Client.hpp"
#include"Remote/Error.hpp"
#include"Remote/Job.hpp"
#include"Remote/JobStore.hpp"
#include"Remote/Orchestrator.hpp"
#include"Reprove/Main.hpp"
#include"Reprove/Mod/Logger.hpp"
#include"Reprove/Mod/SignalHandler.hpp"
#include"Reprove/Mod/Waiter.hpp"
#include"Reprove/Pipeline.hpp"
#include"Reprove/Shutdown.hpp"
#include"Reprove/log.hpp"
#include"Reprove/report.hpp"
#include"S/Bus.hpp"
#include"Solana/ChainError.hpp"
#include"Solana/Keypair.hpp"
#include"Solana/ProgramReader.hpp"
#include"Solana/Rpc.hpp"
#include"Sqlite3.hpp"
#include"Util/make_unique.hpp"
#include"Verify/Engine.hpp"
#include"Verify/Error.hpp"
#include<assert.h>
#include<sodium/core.h>
#include<errno.h>
#include<string.h>
#include<sys/stat.h>
#include<sys/types.h>

#ifdef HAVE_CONFIG_H
# include "config.h"
#endif

std::string g_argv0;

namespace {

/* mkdir -p of the directory holding `file`.  */
void make_parent_dirs(std::string const& file) {
	auto slash = file.rfind('/');
	if (slash == std::string::npos || slash == 0)
		return;
	auto dir = file.substr(0, slash);
	for (auto i = std::size_t(1); i <= dir.size(); ++i) {
		if (i != dir.size() && dir[i] != '/')
			continue;
		auto prefix = dir.substr(0, i);
		if (mkdir(prefix.c_str(), 0700) < 0 && errno != EEXIST)
			throw Build::ConfigError( "Cannot create " + prefix
						+ ": " + strerror(errno)
						);
	}
}

}

namespace Reprove {

class Main::Impl {
private:
	std::ostream& cout;
	std::ostream& cerr;

	std::string argv0;
	Config cfg;
	std::string config_error;

	std::unique_ptr<S::Bus> bus;
	std::unique_ptr<Ev::ThreadPool> threadpool;
	std::unique_ptr<Mod::Logger> logger;
	std::unique_ptr<Mod::SignalHandler> signal_handler;
	std::unique_ptr<Mod::Waiter> waiter;

	Digest::Policy policy;

	/* Local pipeline.  */
	std::unique_ptr<Build::Catalog> catalog;
	std::unique_ptr<Build::OutputDir> outdir;
	std::unique_ptr<Build::Builder> builder;
	std::unique_ptr<Http::Connection> rpc_conn;
	std::unique_ptr<Solana::Rpc> rpc;
	std::unique_ptr<Solana::ProgramReader> reader;
	std::unique_ptr<Verify::Engine> engine;
	std::unique_ptr<Reprove::Pipeline> pipeline;

	/* Remote jobs.  */
	std::unique_ptr<Http::Connection> remote_conn;
	std::unique_ptr<Remote::Client> client;
	std::unique_ptr<Remote::JobStore> store;
	std::unique_ptr<Remote::Orchestrator> orchestrator;

public:
	Impl( std::vector<std::string> argv
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    , Config::Env getenv
	    ) : cout(cout_)
	      , cerr(cerr_)
	      {
		assert(argv.size() >= 1);
		argv0 = argv[0];
		g_argv0 = argv[0];
		try {
			cfg = Config::parse(argv, getenv);
		} catch (Build::ConfigError const& e) {
			config_error = e.what();
		}
		if (sodium_init() < 0)
			config_error = "Cannot initialize libsodium";
		policy.blank_elf_metadata = cfg.elf_blanking;
	}

private:
	void usage() {
		cout << "Usage: " << argv0 << " [options] <command> ..." << std::endl
		     << std::endl
		     << "Commands:" << std::endl
		     << " build [path]                     Build the crate at path." << std::endl
		     << " verify-from-repo -u URL --program-id ID REPO" << std::endl
		     << "                                  Rebuild REPO and compare with the deployed program." << std::endl
		     << " get-executable-hash FILE         Print the digest of a local binary." << std::endl
		     << " get-program-hash -u URL ID       Print the digest of a deployed program." << std::endl
		     << " remote submit --program-id ID REPO" << std::endl
		     << " remote get-status JOB_ID" << std::endl
		     << " remote wait JOB_ID" << std::endl
		     << " remote list" << std::endl
		     << std::endl
		     << "Build options:" << std::endl
		     << " --library-name N, --base-image TAG, --toolchain-version V," << std::endl
		     << " --mount-path P, --commit-hash H, --flag KEY=VALUE" << std::endl
		     << std::endl
		     << "Verification options:" << std::endl
		     << " --url, -u URL      Solana JSON-RPC endpoint ($REPROVE_RPC_URL)." << std::endl
		     << " --attest           Record a verified result on chain." << std::endl
		     << " --keypair FILE     Signer for --attest." << std::endl
		     << " --wait             Wait for a submitted remote job." << std::endl
		     << std::endl
		     << "Global options:" << std::endl
		     << " --log-level L      trace, debug, info, warn or error." << std::endl
		     << " --remote-url URL   Remote verification worker ($REPROVE_REMOTE_URL)." << std::endl
		     << " --db FILE          Local job store ($REPROVE_DB)." << std::endl
		     << " --image-catalog F  CSV of version,image rows." << std::endl
		     << " --docker CMD       Container runtime ($REPROVE_DOCKER)." << std::endl
		     << " --build-timeout S, --poll-timeout S" << std::endl
		     << " --commitment C     processed, confirmed or finalized." << std::endl
		     << " --registry-program-id ID" << std::endl
		     << " --keep-output      Keep the temporary build directory." << std::endl
		     << " --no-elf-blanking  Hash ELF metadata sections as they are." << std::endl
		     << " --version, -V      Show version." << std::endl
		     << " --help, -h         Show this help." << std::endl
		     << std::endl
		     << "Send bug reports to: " << PACKAGE_BUGREPORT << std::endl
		     ;
	}

	void print(Json::Out const& js) {
		cout << js.output() << std::endl;
	}

	void make_local() {
		if (cfg.image_catalog.empty())
			catalog = Util::make_unique<Build::Catalog>(
				Build::Catalog::builtin()
			);
		else
			catalog = Util::make_unique<Build::Catalog>(
				Build::Catalog::load_file(cfg.image_catalog)
			);
		outdir = Util::make_unique<Build::OutputDir>();
		if (cfg.keep_output)
			outdir->retain();
		builder = Util::make_unique<Build::Builder>( *bus, *waiter
							   , *catalog
							   , cfg.docker
							   , outdir->get()
							   , policy
							   );
	}
	void make_chain() {
		rpc_conn = Util::make_unique<Http::Connection>( *threadpool
							      , cfg.rpc_url
							      );
		rpc = Util::make_unique<Solana::Rpc>(*rpc_conn);
		reader = Util::make_unique<Solana::ProgramReader>( *bus, *rpc
								 , *waiter
								 , cfg.commitment
								 , policy
								 );
		engine = Util::make_unique<Verify::Engine>( *bus, *rpc, *waiter
							  , cfg.registry_program_id
							  , cfg.commitment
							  );
	}
	Ev::Io<void> make_remote() {
		make_parent_dirs(cfg.db_path);
		remote_conn = Util::make_unique<Http::Connection>( *threadpool
								 , cfg.remote_url
								 );
		client = Util::make_unique<Remote::Client>(*remote_conn);
		store = Util::make_unique<Remote::JobStore>(
			Sqlite3::Db(cfg.db_path)
		);
		orchestrator = Util::make_unique<Remote::Orchestrator>(
			*bus, *client, *store, *waiter
		);
		return store->init();
	}

	Ev::Io<int> build() {
		make_local();
		auto target = Build::Target( cfg.toolchain_version
					   , cfg.path
					   , cfg.commit_hash
					   , cfg.mount_path
					   , cfg.library_name
					   , cfg.flags
					   );
		auto artifact = co_await builder->build( target
						       , cfg.base_image
						       , cfg.build_timeout
						       );
		auto crate_dir = cfg.mount_path.empty()
			       ? cfg.path
			       : cfg.path + "/" + cfg.mount_path
			       ;
		auto installed = Build::install_artifact(artifact, crate_dir);
		co_await Reprove::log( *bus, Info
				     , "Build: installed %s"
				     , installed.c_str()
				     );
		print(artifact_to_json(artifact, installed));
		co_return 0;
	}

	Ev::Io<int> verify_from_repo() {
		auto signer = std::unique_ptr<Solana::Keypair>();
		if (cfg.attest)
			signer = Util::make_unique<Solana::Keypair>(
				Solana::Keypair::load_file(cfg.keypair)
			);
		make_local();
		make_chain();
		pipeline = Util::make_unique<Reprove::Pipeline>( *bus, *builder
							       , *reader, *engine
							       );
		auto target = Build::Target( cfg.toolchain_version
					   , cfg.repo_url
					   , cfg.commit_hash
					   , cfg.mount_path
					   , cfg.library_name
					   , cfg.flags
					   );
		auto report = co_await pipeline->verify_from_repo(
			target, cfg.base_image, cfg.build_timeout,
			Solana::Pubkey(cfg.program_id), signer.get()
		);
		print(verify_report_to_json(report));
		co_return exit_code(report);
	}

	Ev::Io<int> get_executable_hash() {
		auto path = cfg.path;
		auto policy_copy = policy;
		auto canon = co_await threadpool->background<Digest::Canonical>(
			[path, policy_copy]() {
				return Digest::hash_file(path, policy_copy);
			}
		);
		auto rv = Json::Out();
		rv.start_object()
			.field("path", path)
			.field("digest", std::string(canon.digest))
			.field("size", std::uint64_t(canon.bytes.size()))
		.end_object();
		print(rv);
		co_return 0;
	}

	Ev::Io<int> get_program_hash() {
		make_chain();
		auto program = co_await reader->fetch_deployed(
			Solana::Pubkey(cfg.program_id)
		);
		print(program_to_json(program));
		co_return 0;
	}

	Ev::Io<int> remote() {
		co_await make_remote();
		if (cfg.subcommand == "submit") {
			auto params = Remote::JobParams();
			params.repo_url = cfg.repo_url;
			params.program_id = cfg.program_id;
			params.commit_hash = cfg.commit_hash;
			params.library_name = cfg.library_name;
			params.base_image = cfg.base_image;
			auto job_id = co_await orchestrator->submit(params);
			if (!cfg.wait) {
				auto rv = Json::Out();
				rv.start_object()
					.field("job_id", job_id)
				.end_object();
				print(rv);
				co_return 0;
			}
			auto job = co_await orchestrator->wait( job_id
							      , cfg.poll_timeout
							      );
			print(Remote::job_to_json(job));
			co_return exit_code(job);
		} else if (cfg.subcommand == "get-status") {
			auto job = co_await orchestrator->poll(cfg.job_id);
			print(Remote::job_to_json(job));
			co_return 0;
		} else if (cfg.subcommand == "wait") {
			auto job = co_await orchestrator->wait( cfg.job_id
							      , cfg.poll_timeout
							      );
			print(Remote::job_to_json(job));
			co_return exit_code(job);
		}
		/* list */
		auto jobs = co_await store->list();
		auto rv = Json::Out();
		auto arr = rv.start_array();
		for (auto const& job : jobs)
			arr.entry(Remote::job_to_json(job));
		arr.end_array();
		print(rv);
		co_return 0;
	}

	Ev::Io<int> dispatch() {
		if (cfg.command == "build")
			return build();
		else if (cfg.command == "verify-from-repo")
			return verify_from_repo();
		else if (cfg.command == "get-executable-hash")
			return get_executable_hash();
		else if (cfg.command == "get-program-hash")
			return get_program_hash();
		return remote();
	}

public:
	Ev::Io<int> run() {
		if (!config_error.empty()) {
			cerr << argv0 << ": " << config_error << std::endl;
			co_return 1;
		}
		if (cfg.version) {
			cout << PACKAGE_STRING << std::endl;
			co_return 0;
		}
		if (cfg.help) {
			usage();
			co_return 0;
		}

		/* Build our components.  */
		bus = Util::make_unique<S::Bus>();
		threadpool = Util::make_unique<Ev::ThreadPool>();
		logger = Util::make_unique<Mod::Logger>(*bus, cerr, cfg.log_level);
		signal_handler = Util::make_unique<Mod::SignalHandler>(*bus);
		waiter = Util::make_unique<Mod::Waiter>(*bus);

		co_await Ev::yield();

		auto code = 0;
		auto error = std::string();
		try {
			/* Deferred so that synchronous throws while
			 * setting up land here too.  */
			code = co_await Ev::lift().then([this]() {
				return dispatch();
			});
		} catch (Reprove::Shutdown const&) {
			code = 130;
		} catch (Mod::Waiter::TimedOut const&) {
			code = 4;
			error = "Timed out";
		} catch (Build::BuildFailure const& e) {
			code = 1;
			error = e.what();
			if (!e.log_tail.empty())
				error += "\n" + e.log_tail;
		} catch (Build::ConfigError const& e) {
			code = 1;
			error = e.what();
		} catch (Solana::ChainReadError const& e) {
			code = 1;
			error = e.what();
		} catch (Solana::KeypairError const& e) {
			code = 1;
			error = e.what();
		} catch (Digest::ReadError const& e) {
			code = 1;
			error = e.what();
		} catch (Verify::AttestationRefused const& e) {
			code = 1;
			error = e.what();
		} catch (Verify::AttestationError const& e) {
			code = 1;
			error = e.what();
		} catch (Remote::SubmissionError const& e) {
			code = 3;
			error = e.what();
		} catch (Remote::UnknownJob const& e) {
			code = 5;
			error = e.what();
		} catch (Remote::RemoteError const& e) {
			code = 1;
			error = e.what();
		} catch (std::exception const& e) {
			code = 1;
			error = std::string("Uncaught exception: ") + e.what();
		}
		if (signal_handler->interrupted())
			code = 130;
		if (outdir && !outdir->is_retained()) {
			auto dir = outdir->get();
			if (!outdir->remove())
				co_await Reprove::log( *bus, Warn
						     , "Build: could not remove all "
						       "of %s, files created in the "
						       "container may belong to root"
						     , dir.c_str()
						     );
		}
		if (!error.empty())
			co_await Reprove::log(*bus, Error, "%s", error.c_str());

		co_return code;
	}
};

Main::Main( std::vector<std::string> argv
	  , std::ostream& cout
	  , std::ostream& cerr
	  , Config::Env getenv
	  ) : pimpl(Util::make_unique<Impl>( std::move(argv)
					   , cout
					   , cerr
					   , std::move(getenv)
					   ))
	    { }
Main::Main(Main&& o) : pimpl(std::move(o.pimpl)) { }
Main::~Main() { }

Ev::Io<int> Main::run() {
	assert(pimpl);
	return pimpl->run();
}

}
