#undef NDEBUG
#include"Sha256/Hash.hpp"
#include"Sha256/fun.hpp"
#include"Solana/ids.hpp"
#include"Verify/AttestationRecord.hpp"
#include"Verify/Engine.hpp"
#include<assert.h>

namespace {

std::string hex(std::vector<std::uint8_t> const& v) {
	static char const digits[] = "0123456789abcdef";
	auto rv = std::string();
	for (auto b : v) {
		rv.push_back(digits[b >> 4]);
		rv.push_back(digits[b & 0xF]);
	}
	return rv;
}

}

int main() {
	auto d1 = Sha256::fun("hello program");
	auto d2 = Sha256::fun("other program");

	/* Comparison is pure.  */
	auto r = Verify::Engine::verify(d1, d1);
	assert(r.kind() == Verify::Result::Verified);
	assert(r.is_verified());
	assert(r.digest() == d1);
	r = Verify::Engine::verify(d1, d2);
	assert(r.kind() == Verify::Result::Mismatch);
	assert(!r.is_verified());
	assert(r.expected() == d1);
	assert(r.actual() == d2);
	r = Verify::Engine::verify(d1, d2);
	assert(r.expected() == d1);
	r = Verify::Result::error("build", "cargo failed");
	assert(r.kind() == Verify::Result::Error);
	assert(r.error_kind() == "build");
	assert(r.message() == "cargo failed");
	assert(std::string(Verify::result_kind_name(Verify::Result::Mismatch)) == "mismatch");

	/* Discriminators.  */
	assert(hex(Verify::discriminator("account:Attestation")) == "987db75624927949");
	assert(hex(Verify::discriminator("global:attest")) == "53947877908b75a0");

	/* Record layout.  */
	auto program_id = Solana::Pubkey("TokenkegQfeZyiNwAJbNbGfPvEJPYVp96CrDYVsKjuBD");
	auto signer = Solana::Pubkey("AKnL4NNf3DGWZJS6cPknBuEGnVsV4A4m5tgebLHaRSZ9");
	auto rec = Verify::AttestationRecord();
	rec.program_id = program_id;
	rec.digest = d1;
	rec.signer = signer;
	rec.slot = 0x0102030405060708ULL;
	rec.timestamp = -2;
	auto bytes = rec.encode();
	assert(bytes.size() == Verify::AttestationRecord::size);
	assert(hex(std::vector<std::uint8_t>(bytes.begin(), bytes.begin() + 8)) == "987db75624927949");
	assert(bytes[8] == program_id.data()[0]);
	assert(hex(std::vector<std::uint8_t>(bytes.begin() + 40, bytes.begin() + 72)) == std::string(d1));
	assert(bytes[72] == signer.data()[0]);
	assert(bytes[104] == 0x08 && bytes[111] == 0x01);
	assert(bytes[112] == 0xFE && bytes[119] == 0xFF);

	auto back = Verify::AttestationRecord();
	assert(Verify::AttestationRecord::decode(back, bytes));
	assert(back.program_id == program_id);
	assert(back.digest == d1);
	assert(back.signer == signer);
	assert(back.slot == rec.slot);
	assert(back.timestamp == -2);

	/* Accounts may be allocated larger.  */
	bytes.resize(bytes.size() + 8, 0);
	assert(Verify::AttestationRecord::decode(back, bytes));

	auto bad = bytes;
	bad[0] ^= 1;
	assert(!Verify::AttestationRecord::decode(back, bad));
	bad = std::vector<std::uint8_t>(bytes.begin(), bytes.begin() + 119);
	assert(!Verify::AttestationRecord::decode(back, bad));

	/* Addresses.  */
	auto addr = Verify::attestation_address( Solana::ids::attestation_registry()
					       , program_id, signer
					       );
	assert(std::string(addr.address) == "4Fr88MJtwSy9kFvHLciDf5Lzh7h3GidLB4ct1Cmx3Ayd");
	assert(addr.bump == 253);
	auto other = Verify::attestation_address( Solana::ids::attestation_registry()
						, signer, program_id
						);
	assert(other.address != addr.address);

	/* Instruction.  */
	auto ix = Verify::attest_instruction( Solana::ids::attestation_registry()
					    , program_id, signer, d1, 77
					    );
	assert(ix.program_id == Solana::ids::attestation_registry());
	assert(ix.accounts.size() == 4);
	assert(ix.accounts[0].pubkey == addr.address);
	assert(ix.accounts[0].is_writable && !ix.accounts[0].is_signer);
	assert(ix.accounts[1].pubkey == program_id);
	assert(!ix.accounts[1].is_writable);
	assert(ix.accounts[2].pubkey == signer);
	assert(ix.accounts[2].is_signer && ix.accounts[2].is_writable);
	assert(ix.accounts[3].pubkey == Solana::ids::system_program());
	assert(ix.data.size() == 8 + 32 + 8);
	assert(hex(std::vector<std::uint8_t>(ix.data.begin(), ix.data.begin() + 8)) == "53947877908b75a0");
	assert(hex(std::vector<std::uint8_t>(ix.data.begin() + 8, ix.data.begin() + 40)) == std::string(d1));
	assert(ix.data[40] == 77 && ix.data[47] == 0);

	return 0;
}
