#include"Ev/Io.hpp"
#include"Http/ConnectionIF.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Solana/ChainError.hpp"
#include"Solana/Rpc.hpp"
#include"Solana/Transaction.hpp"
#include"Util/Base64.hpp"
#include"Util/make_unique.hpp"
#include<functional>
#include<sstream>

namespace {

/* JSON-RPC codes a node returns while it is
 * catching up.  */
auto constexpr node_unhealthy = long(-32005);
auto constexpr min_context_slot_not_reached = long(-32016);

typedef std::function<void(Json::Detail::Array<Json::Detail::Object<Json::Out>>&)> ParamsFn;

std::unique_ptr<Json::Out> request( std::uint64_t id
				  , std::string const& method
				  , ParamsFn const& params
				  ) {
	auto rv = Util::make_unique<Json::Out>();
	auto obj = rv->start_object();
	obj.field("jsonrpc", std::string("2.0"))
	   .field("id", id)
	   .field("method", method)
	   ;
	auto arr = obj.start_array("params");
	params(arr);
	arr.end_array();
	obj.end_object();
	return rv;
}

Solana::RpcError malformed(std::string const& method, std::string const& why) {
	return Solana::RpcError( Solana::RpcError::Malformed, false, 0
			       , method + ": malformed response: " + why
			       );
}

/* Check the response for failures and return the
 * `result` member.  */
Jsmn::Object unwrap(std::string const& method, Http::Response const& resp) {
	auto transient_status = resp.status == 429 || resp.status >= 500;

	auto const& body = resp.body;
	if (body.is_object() && body.has("error")) {
		auto err = body["error"];
		auto code = long(0);
		auto msg = std::string("unknown error");
		if (err.is_object()) {
			if (err["code"].is_number())
				code = long(double(err["code"]));
			if (err["message"].is_string())
				msg = std::string(err["message"]);
		}
		auto transient = code == node_unhealthy
			      || code == min_context_slot_not_reached
			      || transient_status
			       ;
		throw Solana::RpcError( Solana::RpcError::Rpc, transient, code
				      , method + ": " + msg
				      + " (code " + std::to_string(code) + ")"
				      );
	}
	if (resp.status < 200 || resp.status >= 300)
		throw Solana::RpcError( Solana::RpcError::Http
				      , transient_status
				      , resp.status
				      , method + ": HTTP status "
				      + std::to_string(resp.status)
				      );
	if (!body.is_object() || !body.has("result"))
		throw malformed(method, "no result");
	return body["result"];
}

std::uint64_t to_u64(Jsmn::Object const& o) {
	if (!o.is_number())
		throw Jsmn::TypeError();
	return std::uint64_t(double(o));
}

Solana::Account parse_account(Jsmn::Object const& result) {
	auto rv = Solana::Account();
	rv.context_slot = to_u64(result["context"]["slot"]);
	auto value = result["value"];
	if (value.is_null())
		return rv;

	rv.exists = true;
	rv.owner = Solana::Pubkey(std::string(value["owner"]));
	rv.executable = value["executable"].is_boolean()
		     && bool(value["executable"]);
	rv.lamports = to_u64(value["lamports"]);
	auto data = value["data"];
	if ( !data.is_array() || data.size() != 2
	  || std::string(data[1]) != "base64"
	   )
		throw Jsmn::TypeError();
	if (!Util::Base64::decode(rv.data, std::string(data[0])))
		throw Jsmn::TypeError();
	return rv;
}

}

namespace Solana {

char const* rpc_error_kind_name(RpcError::Kind k) {
	switch (k) {
	case RpcError::Transport: return "transport";
	case RpcError::Http: return "http";
	case RpcError::Rpc: return "rpc";
	case RpcError::Malformed: return "malformed";
	}
	return "unknown";
}

class Rpc::Impl {
private:
	Http::ConnectionIF& conn;
	std::uint64_t next_id;

public:
	explicit
	Impl(Http::ConnectionIF& conn_) : conn(conn_), next_id(1) { }

	/* Perform the call, then hand the `result` to
	 * the parser.  Type errors in parsing become
	 * malformed-response errors.  */
	template<typename a>
	Ev::Io<a> call( std::string method
		      , ParamsFn params
		      , std::function<a(Jsmn::Object const&)> parse
		      ) {
		auto req = request(next_id++, method, params);
		return conn.api("", std::move(req))
		     .catching<Http::ApiError>([method](Http::ApiError const& e) {
			throw RpcError( RpcError::Transport, true, 0
				      , method + ": " + e.what()
				      );
			return Ev::lift(Http::Response());
		}).then([method, parse](Http::Response resp) {
			auto result = unwrap(method, resp);
			try {
				return Ev::lift(parse(result));
			} catch (Jsmn::TypeError const&) {
				throw malformed(method, resp.raw);
			} catch (std::invalid_argument const& e) {
				throw malformed(method, e.what());
			}
		});
	}
};

Rpc::Rpc(Http::ConnectionIF& conn) : pimpl(Util::make_unique<Impl>(conn)) { }
Rpc::~Rpc() =default;

Ev::Io<Account> Rpc::get_account_info( Pubkey const& address
				     , std::string const& commitment
				     , std::uint64_t min_context_slot
				     ) {
	auto addr = std::string(address);
	return pimpl->call<Account>( "getAccountInfo"
				   , [addr, commitment, min_context_slot
				     ](Json::Detail::Array<Json::Detail::Object<Json::Out>>& p) {
		auto opts = p.entry(addr).start_object();
		opts.field("encoding", std::string("base64"))
		    .field("commitment", commitment)
		    ;
		if (min_context_slot != 0)
			opts.field("minContextSlot", min_context_slot);
		opts.end_object();
	}, &parse_account);
}

Ev::Io<LatestBlockhash>
Rpc::get_latest_blockhash(std::string const& commitment) {
	return pimpl->call<LatestBlockhash>( "getLatestBlockhash"
					   , [commitment
					     ](Json::Detail::Array<Json::Detail::Object<Json::Out>>& p) {
		p.start_object()
			.field("commitment", commitment)
		.end_object();
	}, [](Jsmn::Object const& result) {
		auto value = result["value"];
		auto rv = LatestBlockhash();
		rv.blockhash = Blockhash(std::string(value["blockhash"]));
		rv.last_valid_block_height = to_u64(
			value["lastValidBlockHeight"]
		);
		return rv;
	});
}

Ev::Io<Signature> Rpc::send_transaction(Transaction const& tx) {
	auto wire = tx.to_base64();
	return pimpl->call<Signature>( "sendTransaction"
				     , [wire
				       ](Json::Detail::Array<Json::Detail::Object<Json::Out>>& p) {
		p.entry(wire)
		 .start_object()
			.field("encoding", std::string("base64"))
			.field("preflightCommitment", std::string("confirmed"))
		 .end_object();
	}, [](Jsmn::Object const& result) {
		return Signature(std::string(result));
	});
}

Ev::Io<SignatureStatus>
Rpc::get_signature_status(Signature const& signature) {
	auto sig = std::string(signature);
	return pimpl->call<SignatureStatus>( "getSignatureStatuses"
					   , [sig
					     ](Json::Detail::Array<Json::Detail::Object<Json::Out>>& p) {
		p.start_array()
			.entry(sig)
		.end_array();
		p.start_object()
			.field("searchTransactionHistory", true)
		.end_object();
	}, [](Jsmn::Object const& result) {
		auto rv = SignatureStatus();
		auto value = result["value"];
		if (!value.is_array() || value.size() != 1)
			throw Jsmn::TypeError();
		auto st = value[0];
		if (st.is_null())
			return rv;
		rv.found = true;
		rv.slot = to_u64(st["slot"]);
		if (st["confirmationStatus"].is_string())
			rv.confirmation_status = std::string(
				st["confirmationStatus"]
			);
		auto err = st["err"];
		if (!err.is_null()) {
			auto os = std::ostringstream();
			os << err;
			rv.error = os.str();
		}
		return rv;
	});
}

}
