#include"Build/Error.hpp"
#include"Build/Target.hpp"
#include"Reprove/Config.hpp"
#include"Solana/ids.hpp"
#include<cstdlib>
#include<set>

namespace {

/* Options that take a value.  */
std::set<std::string> const valued = {
	"--log-level", "--remote-url", "--db", "--image-catalog",
	"--docker", "--build-timeout", "--poll-timeout",
	"--commitment", "--registry-program-id",
	"--url", "--program-id", "--commit-hash", "--library-name",
	"--base-image", "--toolchain-version", "--mount-path",
	"--flag", "--keypair"
};
/* Options that are switches.  */
std::set<std::string> const switches = {
	"--keep-output", "--no-elf-blanking", "--version", "--help",
	"--attest", "--wait"
};

std::string env_or(Reprove::Config::Env const& getenv, char const* name) {
	auto v = getenv(name);
	return v ? std::string(v) : std::string();
}

double parse_seconds(std::string const& opt, std::string const& v) {
	auto end = (char*) nullptr;
	auto d = std::strtod(v.c_str(), &end);
	if (v.empty() || *end != '\0' || !(d > 0))
		throw Build::ConfigError( opt + ": not a positive number "
					  "of seconds: " + v
					);
	return d;
}

void check_pubkey(std::string const& what, std::string const& v) {
	if (!Solana::Pubkey::valid_string(v))
		throw Build::ConfigError( what + ": not a base58 public key: "
					+ v
					);
}

void require(bool ok, std::string const& msg) {
	if (!ok)
		throw Build::ConfigError(msg);
}

}

namespace Reprove {

std::string default_db_path(Config::Env const& getenv) {
	auto cache = env_or(getenv, "XDG_CACHE_HOME");
	if (cache.empty()) {
		auto home = env_or(getenv, "HOME");
		if (home.empty())
			home = ".";
		cache = home + "/.cache";
	}
	return cache + "/reprove/jobs.sqlite3";
}

Config Config::parse( std::vector<std::string> const& argv
		    , Env const& getenv
		    ) {
	auto rv = Config();
	rv.registry_program_id = Solana::ids::attestation_registry();

	auto log_level = env_or(getenv, "REPROVE_LOG_LEVEL");
	rv.rpc_url = env_or(getenv, "REPROVE_RPC_URL");
	rv.remote_url = env_or(getenv, "REPROVE_REMOTE_URL");
	rv.db_path = env_or(getenv, "REPROVE_DB");
	auto docker = env_or(getenv, "REPROVE_DOCKER");
	if (!docker.empty())
		rv.docker = docker;

	auto operands = std::vector<std::string>();
	auto only_operands = false;
	for (auto i = std::size_t(1); i < argv.size(); ++i) {
		auto arg = argv[i];
		if (only_operands || arg.empty() || arg[0] != '-' || arg == "-") {
			operands.push_back(arg);
			continue;
		}
		if (arg == "--") {
			only_operands = true;
			continue;
		}

		auto value = std::string();
		auto has_value = false;
		auto eq = arg.find('=');
		if (arg.substr(0, 2) == "--" && eq != std::string::npos) {
			value = arg.substr(eq + 1);
			arg = arg.substr(0, eq);
			has_value = true;
		}
		if (arg == "-u")
			arg = "--url";
		else if (arg == "-V")
			arg = "--version";
		else if (arg == "-h")
			arg = "--help";

		if (switches.count(arg)) {
			if (has_value)
				throw Build::ConfigError( arg
							+ " does not take a value"
							);
			if (arg == "--keep-output")
				rv.keep_output = true;
			else if (arg == "--no-elf-blanking")
				rv.elf_blanking = false;
			else if (arg == "--version")
				rv.version = true;
			else if (arg == "--help")
				rv.help = true;
			else if (arg == "--attest")
				rv.attest = true;
			else if (arg == "--wait")
				rv.wait = true;
			continue;
		}
		if (!valued.count(arg))
			throw Build::ConfigError("Unrecognized option: " + arg);
		if (!has_value) {
			if (i + 1 >= argv.size())
				throw Build::ConfigError(arg + " needs a value");
			value = argv[++i];
		}

		if (arg == "--log-level")
			log_level = value;
		else if (arg == "--remote-url")
			rv.remote_url = value;
		else if (arg == "--db")
			rv.db_path = value;
		else if (arg == "--image-catalog")
			rv.image_catalog = value;
		else if (arg == "--docker")
			rv.docker = value;
		else if (arg == "--build-timeout")
			rv.build_timeout = parse_seconds(arg, value);
		else if (arg == "--poll-timeout")
			rv.poll_timeout = parse_seconds(arg, value);
		else if (arg == "--commitment")
			rv.commitment = value;
		else if (arg == "--registry-program-id") {
			check_pubkey(arg, value);
			rv.registry_program_id = Solana::Pubkey(value);
		} else if (arg == "--url")
			rv.rpc_url = value;
		else if (arg == "--program-id")
			rv.program_id = value;
		else if (arg == "--commit-hash")
			rv.commit_hash = value;
		else if (arg == "--library-name")
			rv.library_name = value;
		else if (arg == "--base-image")
			rv.base_image = value;
		else if (arg == "--toolchain-version")
			rv.toolchain_version = value;
		else if (arg == "--mount-path")
			rv.mount_path = value;
		else if (arg == "--keypair")
			rv.keypair = value;
		else if (arg == "--flag") {
			auto feq = value.find('=');
			auto key = value.substr(0, feq);
			auto fval = feq == std::string::npos
				  ? std::string() : value.substr(feq + 1)
				  ;
			if (!Build::Target::valid_flag_key(key))
				throw Build::ConfigError("Invalid build flag: " + value);
			if (!Build::Target::valid_flag_value(fval))
				throw Build::ConfigError( "Invalid value for build "
							  "flag " + key
							);
			if (!rv.flags.emplace(key, fval).second)
				throw Build::ConfigError( "Build flag given twice: "
							+ key
							);
		}
	}

	if (!log_level.empty() && !parse_log_level(log_level, rv.log_level))
		throw Build::ConfigError("Unknown log level: " + log_level);
	if ( rv.commitment != "processed"
	  && rv.commitment != "confirmed"
	  && rv.commitment != "finalized"
	   )
		throw Build::ConfigError("Unknown commitment: " + rv.commitment);
	if (rv.db_path.empty())
		rv.db_path = default_db_path(getenv);

	if (rv.version || rv.help)
		return rv;

	require(!operands.empty(), "No command given, try --help");
	rv.command = operands[0];
	operands.erase(operands.begin());

	if (rv.command == "build") {
		require(operands.size() <= 1, "build: too many operands");
		rv.path = operands.empty() ? "." : operands[0];
	} else if (rv.command == "verify-from-repo") {
		require(operands.size() == 1, "verify-from-repo: need one repository");
		rv.repo_url = operands[0];
		require(!rv.rpc_url.empty(), "verify-from-repo: need -u RPC_URL");
		require(!rv.program_id.empty(), "verify-from-repo: need --program-id");
		check_pubkey("--program-id", rv.program_id);
		require( !rv.attest || !rv.keypair.empty()
		       , "verify-from-repo: --attest needs --keypair"
		       );
	} else if (rv.command == "get-executable-hash") {
		require(operands.size() == 1, "get-executable-hash: need one file");
		rv.path = operands[0];
	} else if (rv.command == "get-program-hash") {
		require(operands.size() == 1, "get-program-hash: need one program id");
		rv.program_id = operands[0];
		check_pubkey("get-program-hash", rv.program_id);
		require(!rv.rpc_url.empty(), "get-program-hash: need -u RPC_URL");
	} else if (rv.command == "remote") {
		require(!operands.empty(), "remote: need a subcommand");
		rv.subcommand = operands[0];
		operands.erase(operands.begin());
		if (rv.subcommand == "submit") {
			require(operands.size() == 1, "remote submit: need one repository");
			rv.repo_url = operands[0];
			require(!rv.program_id.empty(), "remote submit: need --program-id");
			check_pubkey("--program-id", rv.program_id);
		} else if ( rv.subcommand == "get-status"
			 || rv.subcommand == "wait"
			  ) {
			require( operands.size() == 1
			       , "remote " + rv.subcommand + ": need one job id"
			       );
			rv.job_id = operands[0];
		} else if (rv.subcommand == "list") {
			require(operands.empty(), "remote list: too many operands");
		} else
			throw Build::ConfigError( "Unknown remote subcommand: "
						+ rv.subcommand
						);
		if (rv.subcommand != "list")
			require( !rv.remote_url.empty()
			       , "remote: need --remote-url or REPROVE_REMOTE_URL"
			       );
	} else
		throw Build::ConfigError("Unknown command: " + rv.command);

	return rv;
}

}
