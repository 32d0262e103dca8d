#ifndef REPROVE_PIPELINE_HPP
#define REPROVE_PIPELINE_HPP

#include"Build/Artifact.hpp"
#include"Build/Target.hpp"
#include"Solana/ProgramReader.hpp"
#include"Solana/Pubkey.hpp"
#include"Verify/Engine.hpp"
#include"Verify/Result.hpp"
#include<memory>
#include<string>

namespace Build { class BuilderIF; }
namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
namespace Solana { class Keypair; }

namespace Reprove {

/** struct Reprove::VerifyReport
 *
 * @brief everything a local verification found.
 *
 * @desc `artifact` and `program` are null if the
 * pipeline failed before producing them; `result`
 * is then an `Error`.
 * `attestation_error` is set if an attestation was
 * asked for and could not be written.
 */
struct VerifyReport {
	std::shared_ptr<Build::Artifact> artifact;
	std::shared_ptr<Solana::OnChainProgram> program;
	Verify::Result result = Verify::Result::error("", "");
	std::string log_tail;

	bool attested = false;
	Verify::Attestation attestation;
	std::string attestation_error;
};

/** class Reprove::Pipeline
 *
 * @brief the local verification chain: build,
 * digest, fetch the deployed program, compare, and
 * optionally attest.
 */
class Pipeline {
private:
	S::Bus& bus;
	Build::BuilderIF& builder;
	Solana::ProgramReader& reader;
	Verify::Engine& engine;

public:
	Pipeline() =delete;
	Pipeline( S::Bus& bus_
		, Build::BuilderIF& builder_
		, Solana::ProgramReader& reader_
		, Verify::Engine& engine_
		) : bus(bus_)
		  , builder(builder_)
		  , reader(reader_)
		  , engine(engine_)
		  { }

	/** Reprove::Pipeline::verify_from_repo
	 *
	 * @brief rebuild `target` and compare it with
	 * what is deployed at `program_id`.
	 *
	 * @desc Configuration, build and chain read
	 * failures become an `Error` result.
	 * If `signer` is given and the result is
	 * `Verified`, an attestation is written.
	 * A shutdown propagates as
	 * `Reprove::Shutdown`.
	 */
	Ev::Io<VerifyReport>
	verify_from_repo( Build::Target target
			, std::string image
			, double timeout
			, Solana::Pubkey program_id
			, Solana::Keypair const* signer
			);
};

}

#endif /* !defined(REPROVE_PIPELINE_HPP) */
