#ifndef SOLANA_RPC_HPP
#define SOLANA_RPC_HPP

#include"Solana/RpcIF.hpp"
#include<memory>

namespace Http { class ConnectionIF; }

namespace Solana {

/** class Solana::Rpc
 *
 * @brief JSON-RPC 2.0 client for a node, on top of
 * an HTTP connection to the node endpoint.
 *
 * @desc Transport failures, HTTP 429 and 5xx, and
 * the node-unhealthy and min-context-slot JSON-RPC
 * errors are reported as transient `RpcError`s.
 * No retrying is done here.
 */
class Rpc : public RpcIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Rpc() =delete;
	Rpc(Rpc const&) =delete;

	explicit
	Rpc(Http::ConnectionIF& conn);
	~Rpc();

	Ev::Io<Account> get_account_info( Pubkey const& address
					, std::string const& commitment
					, std::uint64_t min_context_slot
					) override;
	Ev::Io<LatestBlockhash>
	get_latest_blockhash(std::string const& commitment) override;
	Ev::Io<Signature> send_transaction(Transaction const& tx) override;
	Ev::Io<SignatureStatus>
	get_signature_status(Signature const& signature) override;
};

}

#endif /* !defined(SOLANA_RPC_HPP) */
