#include"Build/BuilderIF.hpp"
#include"Build/Error.hpp"
#include"Ev/Io.hpp"
#include"Ev/coroutine.hpp"
#include"Reprove/Pipeline.hpp"
#include"Reprove/log.hpp"
#include"S/Bus.hpp"
#include"Solana/ChainError.hpp"
#include"Solana/Keypair.hpp"
#include"Verify/Error.hpp"

namespace Reprove {

Ev::Io<VerifyReport>
Pipeline::verify_from_repo( Build::Target target
			  , std::string image
			  , double timeout
			  , Solana::Pubkey program_id
			  , Solana::Keypair const* signer
			  ) {
	auto rv = VerifyReport();

	auto error_kind = std::string();
	auto message = std::string();
	try {
		auto artifact = co_await builder.build(target, image, timeout);
		rv.artifact = std::make_shared<Build::Artifact>(
			std::move(artifact)
		);
		auto program = co_await reader.fetch_deployed(program_id);
		rv.program = std::make_shared<Solana::OnChainProgram>(
			std::move(program)
		);
	} catch (Build::ConfigError const& e) {
		error_kind = "config";
		message = e.what();
	} catch (Build::BuildFailure const& e) {
		error_kind = "build";
		message = e.what();
		rv.log_tail = e.log_tail;
	} catch (Solana::ChainReadError const& e) {
		error_kind = "chain";
		message = e.what();
	}
	if (!error_kind.empty()) {
		co_await Reprove::log( bus, Reprove::Error
				     , "Verify: %s error: %s"
				     , error_kind.c_str()
				     , message.c_str()
				     );
		rv.result = Verify::Result::error(error_kind, message);
		co_return rv;
	}

	rv.result = Verify::Engine::verify( rv.artifact->digest
					  , rv.program->deployed_digest
					  );
	if (rv.result.is_verified())
		co_await Reprove::log( bus, Reprove::Info
				     , "Verify: %s matches %s"
				     , std::string(program_id).c_str()
				     , std::string(rv.result.digest()).c_str()
				     );
	else
		co_await Reprove::log( bus, Reprove::Warn
				     , "Verify: %s does not match: "
				       "built %s, deployed %s"
				     , std::string(program_id).c_str()
				     , std::string(rv.result.expected()).c_str()
				     , std::string(rv.result.actual()).c_str()
				     );

	if (!signer)
		co_return rv;
	if (!rv.result.is_verified()) {
		co_await Reprove::log( bus, Reprove::Warn
				     , "Verify: not attesting a mismatch"
				     );
		co_return rv;
	}

	try {
		rv.attestation = co_await engine.write_attestation( rv.result
								  , *rv.program
								  , *signer
								  );
		rv.attested = true;
	} catch (Verify::AttestationRefused const& e) {
		rv.attestation_error = e.what();
	} catch (Verify::AttestationError const& e) {
		rv.attestation_error = e.what();
	}
	if (!rv.attestation_error.empty())
		co_await Reprove::log( bus, Reprove::Error
				     , "Verify: attestation failed: %s"
				     , rv.attestation_error.c_str()
				     );
	co_return rv;
}

}
