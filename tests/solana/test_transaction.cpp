#undef NDEBUG
#include"Solana/Keypair.hpp"
#include"Solana/Transaction.hpp"
#include"Util/Base64.hpp"
#include<assert.h>
#include<sodium/core.h>
#include<stdexcept>

namespace {

Solana::Keypair keypair(std::uint8_t fill) {
	std::uint8_t seed[32];
	for (auto& b : seed)
		b = fill;
	return Solana::Keypair::from_seed(seed);
}

Solana::Pubkey key(std::uint8_t fill) {
	std::uint8_t buf[32];
	for (auto& b : buf)
		b = fill;
	return Solana::Pubkey::from_buffer(buf);
}

}

int main() {
	assert(sodium_init() >= 0);

	auto payer = keypair(1);
	auto cosigner = keypair(2);
	auto program = key(0xAA);
	auto writable = key(0xBB);
	auto readonly = key(0xCC);
	auto blockhash = Solana::Blockhash(std::string(Solana::Pubkey(key(7))));

	auto ins = Solana::Instruction();
	ins.program_id = program;
	ins.accounts = { {readonly, false, false}
		       , {writable, false, true}
		       , {cosigner.pubkey(), true, false}
		       , {payer.pubkey(), false, false}
		       , {readonly, false, false}
		       };
	ins.data = {1, 2, 3};

	auto msg = Solana::Message::compile(payer.pubkey(), {ins}, blockhash);

	/* Payer first, then the read-only signer, then
	 * writable and read-only non-signers.  Repeated
	 * accounts appear once.  */
	assert(msg.num_required_signatures == 2);
	assert(msg.num_readonly_signed == 1);
	assert(msg.num_readonly_unsigned == 2);
	assert((msg.account_keys == std::vector<Solana::Pubkey>
		{ payer.pubkey(), cosigner.pubkey(), writable, readonly, program }));
	assert(msg.instructions.size() == 1);
	assert(msg.instructions[0].program_id_index == 4);
	assert((msg.instructions[0].accounts == std::vector<std::uint8_t>{3, 2, 1, 0, 3}));

	/* Wire layout.  */
	auto bytes = msg.serialize();
	assert(bytes.size() == 3 + 1 + 5 * 32 + 32 + 1 + 1 + 1 + 5 + 1 + 3);
	assert(bytes[0] == 2 && bytes[1] == 1 && bytes[2] == 2);
	assert(bytes[3] == 5);
	assert(bytes[4] == payer.pubkey().data()[0]);
	assert(bytes[4 + 5 * 32] == 7);
	auto tail = std::vector<std::uint8_t>(bytes.end() - 12, bytes.end());
	assert((tail == std::vector<std::uint8_t>{1, 4, 5, 3, 2, 1, 0, 3, 3, 1, 2, 3}));

	/* Signing.  */
	auto tx = Solana::Transaction(msg);
	tx.sign({&payer, &cosigner});
	auto wire = tx.serialize();
	assert(wire.size() == 1 + 2 * 64 + bytes.size());
	assert(wire[0] == 2);
	assert(std::vector<std::uint8_t>(wire.begin() + 129, wire.end()) == bytes);
	assert(Solana::verify_signature(payer.pubkey(), tx.signature(), bytes));
	auto second = Solana::Signature::from_buffer(&wire[65]);
	assert(Solana::verify_signature(cosigner.pubkey(), second, bytes));

	auto decoded = std::vector<std::uint8_t>();
	assert(Util::Base64::decode(decoded, tx.to_base64()));
	assert(decoded == wire);

	/* Signer order does not matter.  */
	auto tx2 = Solana::Transaction(msg);
	tx2.sign({&cosigner, &payer});
	assert(tx2.serialize() == wire);

	/* Missing and foreign signers.  */
	auto flag = false;
	try {
		Solana::Transaction(msg).sign({&payer});
	} catch (std::invalid_argument const&) {
		flag = true;
	}
	assert(flag);
	auto stranger = keypair(3);
	flag = false;
	try {
		Solana::Transaction(msg).sign({&payer, &cosigner, &stranger});
	} catch (std::invalid_argument const&) {
		flag = true;
	}
	assert(flag);

	return 0;
}
