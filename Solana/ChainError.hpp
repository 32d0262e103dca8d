#ifndef SOLANA_CHAINERROR_HPP
#define SOLANA_CHAINERROR_HPP

#include"Solana/Pubkey.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Solana {

/** class Solana::ChainReadError
 *
 * @brief base of all failures to read program
 * state from the chain.
 */
class ChainReadError : public Util::BacktraceException<std::runtime_error> {
public:
	ChainReadError(std::string const& msg
		      ) : Util::BacktraceException<std::runtime_error>(msg) { }
};

/* No account exists at the address.  Never retried.  */
class AccountNotFound : public ChainReadError {
public:
	Pubkey const address;

	explicit
	AccountNotFound(Pubkey const& address_
		       ) : ChainReadError( "Account not found: "
					 + std::string(address_)
					 )
			 , address(address_)
			 { }
};

/* The account exists but does not hold a deployed
 * program.  */
class NotExecutable : public ChainReadError {
public:
	Pubkey const address;

	NotExecutable( Pubkey const& address_
		     , std::string const& reason
		     ) : ChainReadError( "Not an executable program: "
				       + std::string(address_)
				       + ": " + reason
				       )
		       , address(address_)
		       { }
};

/** class Solana::RpcError
 *
 * @brief the node could not answer the request.
 *
 * @desc Only transient errors are retried.
 */
class RpcError : public ChainReadError {
public:
	enum Kind {
		/* The request was not delivered.  */
		Transport,
		/* Non-2xx HTTP status.  */
		Http,
		/* JSON-RPC error object.  */
		Rpc,
		/* The response did not have the expected shape.  */
		Malformed
	};
	Kind const kind;
	bool const transient;
	/* HTTP status or JSON-RPC error code, 0 if none.  */
	long const code;

	RpcError( Kind kind_
		, bool transient_
		, long code_
		, std::string const& msg
		) : ChainReadError(msg)
		  , kind(kind_)
		  , transient(transient_)
		  , code(code_)
		  { }
};

char const* rpc_error_kind_name(RpcError::Kind);

}

#endif /* !defined(SOLANA_CHAINERROR_HPP) */
