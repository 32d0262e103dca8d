#ifndef VERIFY_ENGINE_HPP
#define VERIFY_ENGINE_HPP

#include"Solana/Pubkey.hpp"
#include"Verify/Result.hpp"
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Reprove { namespace Mod { class Waiter; }}
namespace S { class Bus; }
namespace Sha256 { class Hash; }
namespace Solana { class Keypair; }
namespace Solana { class RpcIF; }
namespace Solana { struct OnChainProgram; }

namespace Verify {

/** struct Verify::Attestation
 *
 * @brief what `write_attestation` did.
 *
 * @desc If `written` is false, an identical record
 * was already on chain and nothing was sent.
 */
struct Attestation {
	bool written;
	Solana::Pubkey address;
	Solana::Signature signature;
};

/** class Verify::Engine
 *
 * @brief compares digests, and records verified
 * results on chain.
 */
class Engine {
private:
	S::Bus& bus;
	Solana::RpcIF& rpc;
	Reprove::Mod::Waiter& waiter;
	Solana::Pubkey registry;
	std::string commitment;

public:
	Engine() =delete;
	Engine( S::Bus& bus_
	      , Solana::RpcIF& rpc_
	      , Reprove::Mod::Waiter& waiter_
	      , Solana::Pubkey const& registry_
	      , std::string commitment_ = "confirmed"
	      ) : bus(bus_)
		, rpc(rpc_)
		, waiter(waiter_)
		, registry(registry_)
		, commitment(std::move(commitment_))
		{ }

	/** Verify::Engine::verify
	 *
	 * @brief `Verified` if the digests are equal,
	 * else `Mismatch` with the local digest as the
	 * expected one.
	 */
	static
	Result verify( Sha256::Hash const& local
		     , Sha256::Hash const& deployed
		     );

	/** Verify::Engine::write_attestation
	 *
	 * @brief record on chain that `signer` has
	 * verified the deployed digest of `program`.
	 *
	 * @desc Throws `AttestationRefused` without
	 * touching the chain unless `result` is
	 * `Verified` for the digest of `program`.
	 * Skips the write if the signer's record for
	 * the program already holds this digest.
	 * Otherwise sends the transaction and waits
	 * until it is confirmed; failures are
	 * `AttestationError`s.
	 */
	Ev::Io<Attestation>
	write_attestation( Result result
			 , Solana::OnChainProgram const& program
			 , Solana::Keypair const& signer
			 );
};

}

#endif /* !defined(VERIFY_ENGINE_HPP) */
