#ifndef SOLANA_RPCIF_HPP
#define SOLANA_RPCIF_HPP

#include"Solana/Account.hpp"
#include"Solana/Pubkey.hpp"
#include<cstdint>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Solana { class Transaction; }

namespace Solana {

struct LatestBlockhash {
	Blockhash blockhash;
	std::uint64_t last_valid_block_height;
};

/** struct Solana::SignatureStatus
 *
 * @brief what the node knows about a transaction.
 *
 * @desc `found` is false if the node has not seen
 * the signature (yet).  `confirmation_status` is
 * one of `processed`, `confirmed` or `finalized`.
 * If the transaction failed, `error` describes the
 * failure and is otherwise empty.
 */
struct SignatureStatus {
	bool found = false;
	std::uint64_t slot = 0;
	std::string confirmation_status;
	std::string error;
};

/** class Solana::RpcIF
 *
 * @brief the subset of the node JSON-RPC interface
 * used for reading programs and writing
 * attestations.
 *
 * @desc All operations fail with `Solana::RpcError`
 * if the node cannot answer.
 */
class RpcIF {
public:
	virtual ~RpcIF() { }

	/* `min_context_slot` of 0 means no minimum.  */
	virtual
	Ev::Io<Account> get_account_info( Pubkey const& address
					, std::string const& commitment
					, std::uint64_t min_context_slot
					) =0;

	virtual
	Ev::Io<LatestBlockhash>
	get_latest_blockhash(std::string const& commitment) =0;

	/* Returns the signature the node reports.  */
	virtual
	Ev::Io<Signature> send_transaction(Transaction const& tx) =0;

	virtual
	Ev::Io<SignatureStatus>
	get_signature_status(Signature const& signature) =0;
};

}

#endif /* !defined(SOLANA_RPCIF_HPP) */
