#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/coroutine.hpp"
#include"Ev/start.hpp"
#include"Reprove/Mod/Waiter.hpp"
#include"S/Bus.hpp"
#include"Sha256/fun.hpp"
#include"Solana/ChainError.hpp"
#include"Solana/Keypair.hpp"
#include"Solana/ProgramReader.hpp"
#include"Solana/RpcIF.hpp"
#include"Solana/Transaction.hpp"
#include"Solana/ids.hpp"
#include"Util/Base64.hpp"
#include"Verify/AttestationRecord.hpp"
#include"Verify/Engine.hpp"
#include"Verify/Error.hpp"
#include<assert.h>
#include<map>
#include<sodium/core.h>

namespace {

/* A node that confirms whatever it is sent.  */
class FakeRpc : public Solana::RpcIF {
public:
	std::map<Solana::Pubkey, Solana::Account> accounts;
	std::vector<std::vector<std::uint8_t>> sent;
	std::string tx_error;
	std::size_t status_calls = 0;

	Ev::Io<Solana::Account>
	get_account_info( Solana::Pubkey const& address
			, std::string const&
			, std::uint64_t
			) override {
		auto rv = Solana::Account();
		auto it = accounts.find(address);
		if (it != accounts.end())
			rv = it->second;
		return Ev::lift(rv);
	}
	Ev::Io<Solana::LatestBlockhash>
	get_latest_blockhash(std::string const&) override {
		auto rv = Solana::LatestBlockhash();
		rv.blockhash = Solana::Blockhash(
			"EkSnNWid2cvwEVnVx9aBqawnmiCNiDgp3gUdkDPTKN1N"
		);
		rv.last_valid_block_height = 1000;
		return Ev::lift(rv);
	}
	Ev::Io<Solana::Signature>
	send_transaction(Solana::Transaction const& tx) override {
		sent.push_back(tx.serialize());
		return Ev::lift(tx.signature());
	}
	Ev::Io<Solana::SignatureStatus>
	get_signature_status(Solana::Signature const&) override {
		++status_calls;
		auto rv = Solana::SignatureStatus();
		rv.found = true;
		rv.slot = 900;
		rv.confirmation_status = "confirmed";
		rv.error = tx_error;
		return Ev::lift(rv);
	}
};

Solana::Keypair make_signer() {
	std::uint8_t seed[32];
	for (auto& b : seed)
		b = 1;
	return Solana::Keypair::from_seed(seed);
}

Solana::OnChainProgram make_program(Sha256::Hash const& digest) {
	auto rv = Solana::OnChainProgram();
	rv.program_id = Solana::Pubkey(
		"TokenkegQfeZyiNwAJbNbGfPvEJPYVp96CrDYVsKjuBD"
	);
	rv.loader_kind = Solana::OnChainProgram::Upgradeable;
	rv.deployed_digest = digest;
	rv.slot_observed = 321;
	rv.executable_size = 13;
	rv.deployment_slot = 0;
	rv.has_upgrade_authority = false;
	return rv;
}

Ev::Io<bool>
refused( Verify::Engine& engine
       , Verify::Result result
       , Solana::OnChainProgram const& program
       , Solana::Keypair const& signer
       ) {
	auto flag = false;
	try {
		co_await engine.write_attestation(result, program, signer);
	} catch (Verify::AttestationRefused const&) {
		flag = true;
	}
	co_return flag;
}

Ev::Io<int> test(S::Bus& bus, Reprove::Mod::Waiter& waiter) {
	auto digest = Sha256::fun("hello program");
	auto other = Sha256::fun("other program");
	auto program = make_program(digest);
	auto signer = make_signer();
	auto registry = Solana::ids::attestation_registry();

	auto rpc = FakeRpc();
	auto engine = Verify::Engine(bus, rpc, waiter, registry);

	/* Only verified, deployed digests are attested.  */
	auto flag = co_await refused( engine, Verify::Engine::verify(digest, other)
				    , program, signer
				    );
	assert(flag);
	flag = co_await refused( engine, Verify::Result::error("build", "x")
			       , program, signer
			       );
	assert(flag);
	flag = co_await refused( engine, Verify::Result::verified(other)
			       , program, signer
			       );
	assert(flag);
	assert(rpc.sent.empty());

	/* Write.  */
	auto result = Verify::Engine::verify(digest, digest);
	auto att = co_await engine.write_attestation(result, program, signer);
	assert(att.written);
	auto expected_address = Verify::attestation_address(
		registry, program.program_id, signer.pubkey()
	).address;
	assert(att.address == expected_address);
	assert(rpc.sent.size() == 1);
	assert(rpc.status_calls == 1);

	/* The transaction is signed by the signer alone,
	 * who also pays.  */
	auto const& wire = rpc.sent[0];
	assert(wire[0] == 1);
	auto sig = Solana::Signature::from_buffer(&wire[1]);
	assert(sig == att.signature);
	auto msg = std::vector<std::uint8_t>(wire.begin() + 65, wire.end());
	assert(Solana::verify_signature(signer.pubkey(), sig, msg));
	assert(msg[0] == 1);
	assert(Solana::Pubkey::from_buffer(&msg[4]) == signer.pubkey());
	/* Instruction data ends with the observed slot.  */
	auto slot_bytes = std::vector<std::uint8_t>(wire.end() - 8, wire.end());
	assert((slot_bytes == std::vector<std::uint8_t>{65, 1, 0, 0, 0, 0, 0, 0}));

	/* Already on chain: nothing is sent.  */
	auto rec = Verify::AttestationRecord();
	rec.program_id = program.program_id;
	rec.digest = digest;
	rec.signer = signer.pubkey();
	rec.slot = 321;
	rec.timestamp = 1700000000;
	auto acct = Solana::Account();
	acct.exists = true;
	acct.owner = registry;
	acct.data = rec.encode();
	rpc.accounts[expected_address] = acct;
	att = co_await engine.write_attestation(result, program, signer);
	assert(!att.written);
	assert(att.address == expected_address);
	assert(rpc.sent.size() == 1);

	/* A stale record is overwritten.  */
	rec.digest = other;
	rpc.accounts[expected_address].data = rec.encode();
	att = co_await engine.write_attestation(result, program, signer);
	assert(att.written);
	assert(rpc.sent.size() == 2);

	/* Failed transaction.  */
	rpc.tx_error = "{\"InstructionError\":[0,{\"Custom\":6000}]}";
	flag = false;
	try {
		co_await engine.write_attestation(result, program, signer);
	} catch (Verify::AttestationError const& e) {
		flag = true;
		assert(std::string(e.what()).find("Custom") != std::string::npos);
	}
	assert(flag);

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
