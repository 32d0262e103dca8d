#include"Build/Artifact.hpp"
#include"Remote/Job.hpp"
#include"Reprove/Pipeline.hpp"
#include"Reprove/report.hpp"
#include"Solana/ProgramReader.hpp"

namespace Reprove {

Json::Out artifact_to_json( Build::Artifact const& artifact
			  , std::string const& installed_path
			  ) {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	obj.field("binary_name", artifact.binary_name)
	   .field("digest", std::string(artifact.digest))
	   .field("size", artifact.size)
	   .field("image", artifact.image)
	   ;
	if (!artifact.commit.empty())
		obj.field("commit", artifact.commit);
	obj.field("path", installed_path.empty() ? artifact.raw_path
						 : installed_path
		 );
	obj.end_object();
	return rv;
}

Json::Out program_to_json(Solana::OnChainProgram const& p) {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	obj.field("program_id", std::string(p.program_id))
	   .field("loader", std::string(Solana::loader_kind_name(p.loader_kind)))
	   .field("digest", std::string(p.deployed_digest))
	   .field("executable_size", p.executable_size)
	   .field("slot", p.slot_observed)
	   ;
	if (p.loader_kind == Solana::OnChainProgram::Upgradeable) {
		obj.field("program_data_address", std::string(p.program_data_address))
		   .field("deployment_slot", p.deployment_slot)
		   ;
		if (p.has_upgrade_authority)
			obj.field("upgrade_authority", std::string(p.upgrade_authority));
		else
			obj.field("upgrade_authority", nullptr);
	}
	obj.end_object();
	return rv;
}

Json::Out verify_report_to_json(VerifyReport const& r) {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	auto const& res = r.result;
	obj.field("result", std::string(Verify::result_kind_name(res.kind())));
	switch (res.kind()) {
	case Verify::Result::Verified:
		obj.field("digest", std::string(res.digest()));
		break;
	case Verify::Result::Mismatch:
		obj.field("expected", std::string(res.expected()))
		   .field("actual", std::string(res.actual()))
		   ;
		break;
	case Verify::Result::Error:
		obj.field("error_kind", res.error_kind())
		   .field("message", res.message())
		   ;
		if (!r.log_tail.empty())
			obj.field("log_tail", r.log_tail);
		break;
	}
	if (r.artifact)
		obj.field("artifact", artifact_to_json(*r.artifact));
	if (r.program)
		obj.field("program", program_to_json(*r.program));
	if (r.attested) {
		obj.start_object("attestation")
			.field("written", r.attestation.written)
			.field("address", std::string(r.attestation.address))
			.field( "signature"
			      , r.attestation.written
			      ? std::string(r.attestation.signature)
			      : std::string()
			      )
		.end_object();
	} else if (!r.attestation_error.empty())
		obj.field("attestation_error", r.attestation_error);
	obj.end_object();
	return rv;
}

int exit_code(VerifyReport const& r) {
	switch (r.result.kind()) {
	case Verify::Result::Verified:
		return r.attestation_error.empty() ? 0 : 1;
	case Verify::Result::Mismatch:
		return 2;
	case Verify::Result::Error:
		return 1;
	}
	return 1;
}

int exit_code(Remote::Job const& job) {
	switch (job.status) {
	case Remote::TimedOut:
		return 4;
	case Remote::Failed:
		return 1;
	case Remote::Succeeded:
		if (job.has_result && job.result.outcome == "mismatch")
			return 2;
		if (job.has_result && job.result.outcome == "error")
			return 1;
		return 0;
	default:
		return 0;
	}
}

}
