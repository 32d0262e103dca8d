#include"Digest/canonicalize_and_hash.hpp"
#include"Ev/Io.hpp"
#include"Ev/coroutine.hpp"
#include"Reprove/Mod/Waiter.hpp"
#include"Reprove/log.hpp"
#include"Solana/Account.hpp"
#include"Solana/ChainError.hpp"
#include"Solana/LoaderState.hpp"
#include"Solana/ProgramReader.hpp"
#include"Solana/RpcIF.hpp"

namespace {

auto constexpr max_attempts = 3;
double const backoff[] = {0.5, 1.0};

}

namespace Solana {

char const* loader_kind_name(OnChainProgram::LoaderKind k) {
	switch (k) {
	case OnChainProgram::Upgradeable: return "upgradeable";
	case OnChainProgram::Direct: return "direct";
	}
	return "unknown";
}

Ev::Io<Account> ProgramReader::read_account( Pubkey address
					   , std::uint64_t min_context_slot
					   ) {
	for (auto attempt = 1; ; ++attempt) {
		auto why = std::string();
		try {
			co_return co_await rpc.get_account_info( address
							       , commitment
							       , min_context_slot
							       );
		} catch (RpcError const& e) {
			if (!e.transient || attempt >= max_attempts)
				throw;
			why = e.what();
		}
		co_await Reprove::log( bus, Reprove::Warn
				     , "ProgramReader: attempt %d for %s "
				       "failed, retrying: %s"
				     , attempt
				     , std::string(address).c_str()
				     , why.c_str()
				     );
		co_await waiter.wait(backoff[attempt - 1]);
	}
}

Ev::Io<OnChainProgram> ProgramReader::fetch_deployed(Pubkey program_id) {
	auto account = co_await read_account(program_id, 0);
	if (!account.exists)
		throw AccountNotFound(program_id);

	auto decoded = decode_program_account(program_id, account);
	if (decoded.kind == ProgramAccount::NotExecutable)
		throw NotExecutable(program_id, decoded.reason);

	auto rv = OnChainProgram();
	rv.program_id = program_id;
	rv.deployment_slot = 0;
	rv.has_upgrade_authority = false;
	auto executable = std::vector<std::uint8_t>();

	if (decoded.kind == ProgramAccount::Upgradeable) {
		rv.loader_kind = OnChainProgram::Upgradeable;
		rv.program_data_address = decoded.programdata_address;
		co_await Reprove::log( bus, Reprove::Debug
				     , "ProgramReader: %s is upgradeable, "
				       "program data at %s"
				     , std::string(program_id).c_str()
				     , std::string(rv.program_data_address)
						.c_str()
				     );
		/* The program data must be at least as recent
		 * as the program account.  */
		auto pd_account = co_await read_account(
			rv.program_data_address, account.context_slot
		);
		auto pd = decode_program_data( rv.program_data_address
					     , pd_account
					     );
		rv.slot_observed = pd_account.context_slot;
		rv.deployment_slot = pd.deployment_slot;
		rv.has_upgrade_authority = pd.has_upgrade_authority;
		rv.upgrade_authority = pd.upgrade_authority;
		executable = std::move(pd.executable);
	} else {
		rv.loader_kind = OnChainProgram::Direct;
		rv.slot_observed = account.context_slot;
		executable = std::move(account.data);
	}

	rv.executable_size = executable.size();
	rv.deployed_digest = Digest::canonicalize_and_hash(
		std::move(executable), policy
	).digest;

	co_await Reprove::log( bus, Reprove::Info
			     , "ProgramReader: %s deployed digest %s "
			       "at slot %llu"
			     , std::string(program_id).c_str()
			     , std::string(rv.deployed_digest).c_str()
			     , (unsigned long long) rv.slot_observed
			     );
	co_return rv;
}

}
