#ifndef REPROVE_CONFIG_HPP
#define REPROVE_CONFIG_HPP

#include"Reprove/log.hpp"
#include"Solana/Pubkey.hpp"
#include<functional>
#include<map>
#include<string>
#include<vector>

namespace Reprove {

/** struct Reprove::Config
 *
 * @brief everything the command line says, with
 * environment fallbacks applied.
 *
 * @desc Built once by `Reprove::Config::parse`, which
 * validates it, then passed around by const
 * reference.
 */
struct Config {
	/* Global options.  */
	LogLevel log_level = Info;
	std::string rpc_url;
	std::string remote_url;
	std::string db_path;
	std::string image_catalog;
	std::string docker = "docker";
	double build_timeout = 3600;
	double poll_timeout = 1800;
	std::string commitment = "confirmed";
	Solana::Pubkey registry_program_id;
	bool keep_output = false;
	bool elf_blanking = true;
	bool version = false;
	bool help = false;

	/* `build`, `verify-from-repo`, `get-executable-hash`,
	 * `get-program-hash` or `remote`.  */
	std::string command;
	/* `submit`, `get-status`, `wait` or `list`, for
	 * `remote`.  */
	std::string subcommand;

	/* Build target.  */
	std::string library_name;
	std::string base_image;
	std::string toolchain_version;
	std::string mount_path;
	std::string commit_hash;
	std::map<std::string, std::string> flags;

	/* Operands.  */
	std::string program_id;
	std::string repo_url;
	std::string path;
	std::string job_id;

	bool attest = false;
	std::string keypair;
	bool wait = false;

	typedef std::function<char const*(char const*)> Env;

	/** Reprove::Config::parse
	 *
	 * @brief parse `argv` (including `argv[0]`).
	 *
	 * @desc Throws `Build::ConfigError` on any
	 * unknown option, missing operand or invalid
	 * value.
	 */
	static
	Config parse( std::vector<std::string> const& argv
		    , Env const& getenv
		    );
};

/* Default location of the job store.  */
std::string default_db_path(Config::Env const& getenv);

}

#endif /* !defined(REPROVE_CONFIG_HPP) */
