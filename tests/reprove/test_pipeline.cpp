#undef NDEBUG
#include"Build/Artifact.hpp"
#include"Build/BuilderIF.hpp"
#include"Build/Error.hpp"
#include"Build/Target.hpp"
#include"Ev/Io.hpp"
#include"Ev/coroutine.hpp"
#include"Ev/start.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Remote/Job.hpp"
#include"Reprove/Mod/Waiter.hpp"
#include"Reprove/Pipeline.hpp"
#include"Reprove/report.hpp"
#include"S/Bus.hpp"
#include"Sha256/fun.hpp"
#include"Solana/Account.hpp"
#include"Solana/Keypair.hpp"
#include"Solana/LoaderState.hpp"
#include"Solana/ProgramReader.hpp"
#include"Solana/RpcIF.hpp"
#include"Solana/Transaction.hpp"
#include"Solana/ids.hpp"
#include"Verify/Engine.hpp"
#include<assert.h>
#include<map>
#include<sodium/core.h>

namespace {

auto const program_id = Solana::Pubkey(
	"TokenkegQfeZyiNwAJbNbGfPvEJPYVp96CrDYVsKjuBD"
);
auto const programdata_id = Solana::Pubkey(
	"FasEiG8vYccazKrgdRf8KJ2ZnqajRNwQZfJ1RqaDdiu1"
);

class FakeBuilder : public Build::BuilderIF {
public:
	std::size_t builds = 0;
	std::string output = "hello program";
	bool fail = false;

	Ev::Io<Build::Artifact> build( Build::Target const& target
				     , std::string image
				     , double timeout
				     ) override {
		++builds;
		assert(timeout == 600);
		if (fail)
			return Ev::lift().then([]() -> Ev::Io<Build::Artifact> {
				throw Build::BuildFailure( "Build failed with exit code 101"
							 , 101
							 , "error[E0425]: cannot find value"
							 );
			});
		auto rv = Build::Artifact();
		rv.raw_path = "/tmp/out/deploy/hello.so";
		rv.digest = Sha256::fun(output);
		rv.size = output.size();
		rv.binary_name = "hello";
		rv.image = image.empty() ? "solanafoundation/solana-verifiable-build:1.18.26"
					 : image;
		rv.commit = target.commit_ref;
		return Ev::lift(rv);
	}
};

/* A node holding one upgradeable program, which
 * confirms whatever it is sent.  */
class FakeRpc : public Solana::RpcIF {
public:
	std::map<Solana::Pubkey, Solana::Account> accounts;
	std::size_t reads = 0;
	std::size_t sent = 0;

	void deploy(std::string const& exe) {
		auto prog = Solana::Account();
		prog.context_slot = 500;
		prog.exists = true;
		prog.owner = Solana::ids::bpf_loader_upgradeable();
		prog.executable = true;
		prog.data = {2, 0, 0, 0};
		prog.data.insert( prog.data.end()
				, programdata_id.data()
				, programdata_id.data() + 32
				);
		accounts[program_id] = prog;

		auto pd = Solana::Account();
		pd.context_slot = 501;
		pd.exists = true;
		pd.owner = Solana::ids::bpf_loader_upgradeable();
		pd.data = {3, 0, 0, 0, 44, 1, 0, 0, 0, 0, 0, 0, 0};
		pd.data.resize(Solana::programdata_header_size, 0);
		pd.data.insert(pd.data.end(), exe.begin(), exe.end());
		pd.data.resize(pd.data.size() + 64, 0);
		accounts[programdata_id] = pd;
	}

	Ev::Io<Solana::Account>
	get_account_info( Solana::Pubkey const& address
			, std::string const&
			, std::uint64_t
			) override {
		++reads;
		auto rv = Solana::Account();
		auto it = accounts.find(address);
		if (it != accounts.end())
			rv = it->second;
		return Ev::lift(rv);
	}
	Ev::Io<Solana::LatestBlockhash>
	get_latest_blockhash(std::string const&) override {
		auto rv = Solana::LatestBlockhash();
		rv.last_valid_block_height = 1000;
		return Ev::lift(rv);
	}
	Ev::Io<Solana::Signature>
	send_transaction(Solana::Transaction const& tx) override {
		++sent;
		return Ev::lift(tx.signature());
	}
	Ev::Io<Solana::SignatureStatus>
	get_signature_status(Solana::Signature const&) override {
		auto rv = Solana::SignatureStatus();
		rv.found = true;
		rv.slot = 600;
		rv.confirmation_status = "finalized";
		return Ev::lift(rv);
	}
};

Jsmn::Object to_js(Json::Out const& out) {
	auto parser = Jsmn::Parser();
	return parser.feed(out.output())[0];
}

Ev::Io<int> test(S::Bus& bus, Reprove::Mod::Waiter& waiter) {
	auto builder = FakeBuilder();
	auto rpc = FakeRpc();
	auto reader = Solana::ProgramReader(bus, rpc, waiter);
	auto engine = Verify::Engine( bus, rpc, waiter
				    , Solana::ids::attestation_registry()
				    );
	auto pipeline = Reprove::Pipeline(bus, builder, reader, engine);
	auto target = Build::Target( "1.18.26"
				   , "https://github.com/example/hello"
				   , "0123abc"
				   );
	auto digest = Sha256::fun("hello program");

	/* Deployed program matches the build.  */
	rpc.deploy("hello program");
	auto report = co_await pipeline.verify_from_repo( target, "", 600
							, program_id, nullptr
							);
	assert(report.result.kind() == Verify::Result::Verified);
	assert(report.result.digest() == digest);
	assert(Reprove::exit_code(report) == 0);
	assert(!report.attested);
	auto js = to_js(Reprove::verify_report_to_json(report));
	assert(std::string(js["result"]) == "verified");
	assert(std::string(js["digest"]) == std::string(digest));
	assert(std::string(js["artifact"]["commit"]) == "0123abc");
	assert(std::string(js["program"]["loader"]) == "upgradeable");
	assert(std::string(js["program"]["program_data_address"])
	    == std::string(programdata_id)
	     );
	assert(double(js["program"]["deployment_slot"]) == 300);
	assert(js["program"]["upgrade_authority"].is_null());
	assert(!js.has("attestation"));

	/* Deployed program differs.  */
	rpc.deploy("hello program, patched");
	report = co_await pipeline.verify_from_repo( target, "", 600
						   , program_id, nullptr
						   );
	assert(report.result.kind() == Verify::Result::Mismatch);
	assert(Reprove::exit_code(report) == 2);
	js = to_js(Reprove::verify_report_to_json(report));
	assert(std::string(js["result"]) == "mismatch");
	assert(std::string(js["expected"]) == std::string(digest));
	assert(std::string(js["actual"])
	    == std::string(Sha256::fun("hello program, patched"))
	     );

	/* A mismatch is never attested.  */
	std::uint8_t seed[32];
	for (auto& b : seed)
		b = 1;
	auto signer = Solana::Keypair::from_seed(seed);
	report = co_await pipeline.verify_from_repo( target, "", 600
						   , program_id, &signer
						   );
	assert(report.result.kind() == Verify::Result::Mismatch);
	assert(!report.attested);
	assert(report.attestation_error.empty());
	assert(rpc.sent == 0);

	/* A match is.  */
	rpc.deploy("hello program");
	report = co_await pipeline.verify_from_repo( target, "", 600
						   , program_id, &signer
						   );
	assert(report.result.is_verified());
	assert(report.attested);
	assert(report.attestation.written);
	assert(rpc.sent == 1);
	assert(Reprove::exit_code(report) == 0);
	js = to_js(Reprove::verify_report_to_json(report));
	assert(bool(js["attestation"]["written"]));
	assert(std::string(js["attestation"]["signature"])
	    == std::string(report.attestation.signature)
	     );

	/* Build failure: the chain is not read.  */
	builder.fail = true;
	auto reads = rpc.reads;
	report = co_await pipeline.verify_from_repo( target, "", 600
						   , program_id, nullptr
						   );
	assert(report.result.kind() == Verify::Result::Error);
	assert(report.result.error_kind() == "build");
	assert(!report.artifact);
	assert(!report.program);
	assert(rpc.reads == reads);
	assert(Reprove::exit_code(report) == 1);
	js = to_js(Reprove::verify_report_to_json(report));
	assert(std::string(js["error_kind"]) == "build");
	assert(std::string(js["log_tail"]).find("E0425") != std::string::npos);
	builder.fail = false;

	/* Nothing deployed.  */
	rpc.accounts.clear();
	report = co_await pipeline.verify_from_repo( target, "", 600
						   , program_id, nullptr
						   );
	assert(report.result.kind() == Verify::Result::Error);
	assert(report.result.error_kind() == "chain");
	assert(report.artifact);
	assert(Reprove::exit_code(report) == 1);

	/* Exit codes of remote jobs.  */
	auto job = Remote::Job();
	job.status = Remote::Succeeded;
	job.has_result = true;
	job.result.outcome = "verified";
	assert(Reprove::exit_code(job) == 0);
	job.result.outcome = "mismatch";
	assert(Reprove::exit_code(job) == 2);
	job.result.outcome = "error";
	assert(Reprove::exit_code(job) == 1);
	job.status = Remote::Failed;
	assert(Reprove::exit_code(job) == 1);
	job.status = Remote::TimedOut;
	assert(Reprove::exit_code(job) == 4);
	job.status = Remote::Building;
	assert(Reprove::exit_code(job) == 0);

	co_return 0;
}

}

int main() {
	assert(sodium_init() >= 0);
	auto bus = S::Bus();
	auto waiter = Reprove::Mod::Waiter(bus);
	return Ev::start(Ev::lift().then([&]() {
		return test(bus, waiter);
	}));
}
