#include"Ev/Io.hpp"
#include"Ev/coroutine.hpp"
#include"Reprove/Mod/Waiter.hpp"
#include"Reprove/log.hpp"
#include"Solana/ChainError.hpp"
#include"Solana/Keypair.hpp"
#include"Solana/ProgramReader.hpp"
#include"Solana/RpcIF.hpp"
#include"Solana/Transaction.hpp"
#include"Verify/AttestationRecord.hpp"
#include"Verify/Engine.hpp"
#include"Verify/Error.hpp"

namespace {

/* Confirmation polling.  */
auto constexpr confirm_attempts = 60;
auto constexpr confirm_interval = double(1.0);

bool is_confirmed(Solana::SignatureStatus const& st) {
	return st.confirmation_status == "confirmed"
	    || st.confirmation_status == "finalized"
	     ;
}

}

namespace Verify {

char const* result_kind_name(Result::Kind k) {
	switch (k) {
	case Result::Verified: return "verified";
	case Result::Mismatch: return "mismatch";
	case Result::Error: return "error";
	}
	return "unknown";
}

Result Engine::verify( Sha256::Hash const& local
		     , Sha256::Hash const& deployed
		     ) {
	if (local == deployed)
		return Result::verified(local);
	return Result::mismatch(local, deployed);
}

Ev::Io<Attestation>
Engine::write_attestation( Result result
			 , Solana::OnChainProgram const& program
			 , Solana::Keypair const& signer
			 ) {
	if (!result.is_verified())
		throw AttestationRefused(
			std::string("Refusing to attest a result that is ")
			+ result_kind_name(result.kind())
		);
	if (result.digest() != program.deployed_digest)
		throw AttestationRefused(
			"Refusing to attest a digest that is not deployed"
		);

	auto digest = result.digest();
	auto program_id = program.program_id;
	auto signer_key = signer.pubkey();
	auto address = attestation_address( registry, program_id
					  , signer_key
					  ).address;

	auto rv = Attestation();
	rv.written = false;
	rv.address = address;

	auto existing = Solana::Account();
	try {
		existing = co_await rpc.get_account_info( address
							, commitment
							, 0
							);
	} catch (Solana::RpcError const& e) {
		throw AttestationError( std::string("Cannot read attestation: ")
				      + e.what()
				      );
	}
	auto record = AttestationRecord();
	if ( existing.exists
	  && AttestationRecord::decode(record, existing.data)
	  && record.digest == digest
	   ) {
		co_await Reprove::log( bus, Reprove::Info
				     , "Attest: %s already attests %s, "
				       "not writing"
				     , std::string(address).c_str()
				     , std::string(digest).c_str()
				     );
		co_return rv;
	}

	auto tx_signature = Solana::Signature();
	try {
		auto latest = co_await rpc.get_latest_blockhash(commitment);
		auto ix = attest_instruction( registry, program_id
					    , signer_key
					    , digest
					    , program.slot_observed
					    );
		auto tx = Solana::Transaction(Solana::Message::compile(
			signer_key, {ix}, latest.blockhash
		));
		tx.sign({&signer});
		tx_signature = tx.signature();
		co_await Reprove::log( bus, Reprove::Info
				     , "Attest: sending %s"
				     , std::string(tx_signature).c_str()
				     );
		auto sent = co_await rpc.send_transaction(tx);
		if (sent != tx_signature)
			throw AttestationError(
				"Node reported a different signature: "
				+ std::string(sent)
			);
	} catch (Solana::RpcError const& e) {
		throw AttestationError( std::string("Cannot send attestation: ")
				      + e.what()
				      );
	}

	for (auto i = 0; i < confirm_attempts; ++i) {
		co_await waiter.wait(confirm_interval);
		auto status = Solana::SignatureStatus();
		auto failed = false;
		try {
			status = co_await rpc.get_signature_status(tx_signature);
		} catch (Solana::RpcError const& e) {
			if (!e.transient)
				throw AttestationError(
					std::string("Cannot confirm attestation: ")
					+ e.what()
				);
			failed = true;
		}
		if (failed || !status.found)
			continue;
		if (!status.error.empty())
			throw AttestationError( "Attestation transaction "
					      + std::string(tx_signature)
					      + " failed: " + status.error
					      );
		if (is_confirmed(status)) {
			co_await Reprove::log( bus, Reprove::Info
					     , "Attest: %s confirmed at slot %llu"
					     , std::string(tx_signature).c_str()
					     , (unsigned long long) status.slot
					     );
			rv.written = true;
			rv.signature = tx_signature;
			co_return rv;
		}
	}
	throw AttestationError( "Attestation transaction "
			      + std::string(tx_signature)
			      + " was not confirmed"
			      );
}

}
