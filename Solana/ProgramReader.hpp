#ifndef SOLANA_PROGRAMREADER_HPP
#define SOLANA_PROGRAMREADER_HPP

#include"Digest/Policy.hpp"
#include"Sha256/Hash.hpp"
#include"Solana/Pubkey.hpp"
#include<cstdint>
#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Reprove { namespace Mod { class Waiter; }}
namespace S { class Bus; }
namespace Solana { class RpcIF; }
namespace Solana { struct Account; }

namespace Solana {

/** struct Solana::OnChainProgram
 *
 * @brief the executable deployed at a program
 * address, as observed at `slot_observed`.
 *
 * @desc `program_data_address`, `deployment_slot`
 * and the upgrade authority are meaningful only for
 * the upgradeable loader.
 */
struct OnChainProgram {
	enum LoaderKind {
		Upgradeable,
		Direct
	};

	Pubkey program_id;
	LoaderKind loader_kind;
	Pubkey program_data_address;
	Sha256::Hash deployed_digest;
	std::uint64_t slot_observed;
	std::uint64_t executable_size;

	std::uint64_t deployment_slot;
	bool has_upgrade_authority;
	Pubkey upgrade_authority;
};

char const* loader_kind_name(OnChainProgram::LoaderKind);

/** class Solana::ProgramReader
 *
 * @brief reads the currently deployed executable of
 * a program and digests it.
 *
 * @desc Transient `RpcError`s are retried up to
 * three attempts in all, waiting 0.5 seconds and
 * then 1 second between attempts.
 * Nothing is cached; every call reads the chain
 * afresh.
 */
class ProgramReader {
private:
	S::Bus& bus;
	RpcIF& rpc;
	Reprove::Mod::Waiter& waiter;
	std::string commitment;
	Digest::Policy policy;

	Ev::Io<Account> read_account( Pubkey address
				    , std::uint64_t min_context_slot
				    );

public:
	ProgramReader() =delete;
	ProgramReader( S::Bus& bus_
		     , RpcIF& rpc_
		     , Reprove::Mod::Waiter& waiter_
		     , std::string commitment_ = "confirmed"
		     , Digest::Policy policy_ = Digest::Policy()
		     ) : bus(bus_)
		       , rpc(rpc_)
		       , waiter(waiter_)
		       , commitment(std::move(commitment_))
		       , policy(policy_)
		       { }

	/* Throws `AccountNotFound`, `NotExecutable` or
	 * `RpcError`.  */
	Ev::Io<OnChainProgram> fetch_deployed(Pubkey program_id);
};

}

#endif /* !defined(SOLANA_PROGRAMREADER_HPP) */
