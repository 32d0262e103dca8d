#undef NDEBUG
#include"Solana/Account.hpp"
#include"Solana/ChainError.hpp"
#include"Solana/LoaderState.hpp"
#include"Solana/Pda.hpp"
#include"Solana/ids.hpp"
#include<assert.h>

namespace {

auto const token_program = Solana::Pubkey(
	"TokenkegQfeZyiNwAJbNbGfPvEJPYVp96CrDYVsKjuBD"
);

void put_u32(std::vector<std::uint8_t>& v, std::uint32_t x) {
	for (auto i = 0; i < 4; ++i)
		v.push_back(std::uint8_t(x >> (8 * i)));
}
void put_u64(std::vector<std::uint8_t>& v, std::uint64_t x) {
	for (auto i = 0; i < 8; ++i)
		v.push_back(std::uint8_t(x >> (8 * i)));
}
void put_key(std::vector<std::uint8_t>& v, Solana::Pubkey const& k) {
	v.insert(v.end(), k.data(), k.data() + Solana::Pubkey::size);
}

Solana::Account upgradeable_account(std::vector<std::uint8_t> data) {
	auto rv = Solana::Account();
	rv.exists = true;
	rv.owner = Solana::ids::bpf_loader_upgradeable();
	rv.executable = true;
	rv.data = std::move(data);
	return rv;
}

bool decode_data_fails(Solana::Account const& a) {
	try {
		Solana::decode_program_data(token_program, a);
	} catch (Solana::NotExecutable const&) {
		return true;
	}
	return false;
}

}

int main() {
	auto pda = Solana::Pubkey("FasEiG8vYccazKrgdRf8KJ2ZnqajRNwQZfJ1RqaDdiu1");

	/* Upgradeable program pointing at its program data.  */
	auto data = std::vector<std::uint8_t>();
	put_u32(data, 2);
	put_key(data, pda);
	auto r = Solana::decode_program_account( token_program
					       , upgradeable_account(data)
					       );
	assert(r.kind == Solana::ProgramAccount::Upgradeable);
	assert(r.programdata_address == pda);

	/* Program data address not derived from the program.  */
	auto bad = std::vector<std::uint8_t>();
	put_u32(bad, 2);
	put_key(bad, token_program);
	r = Solana::decode_program_account(token_program, upgradeable_account(bad));
	assert(r.kind == Solana::ProgramAccount::NotExecutable);

	/* Buffers are not programs.  */
	auto buffer = std::vector<std::uint8_t>();
	put_u32(buffer, 1);
	buffer.push_back(0);
	r = Solana::decode_program_account(token_program, upgradeable_account(buffer));
	assert(r.kind == Solana::ProgramAccount::NotExecutable);
	assert(r.reason.find("buffer") != std::string::npos);

	r = Solana::decode_program_account( token_program
					  , upgradeable_account({2, 0})
					  );
	assert(r.kind == Solana::ProgramAccount::NotExecutable);

	/* Older loaders hold the executable directly.  */
	auto direct = Solana::Account();
	direct.exists = true;
	direct.owner = Solana::ids::bpf_loader();
	direct.executable = true;
	direct.data = {0x7f, 'E', 'L', 'F'};
	r = Solana::decode_program_account(token_program, direct);
	assert(r.kind == Solana::ProgramAccount::Direct);
	direct.owner = Solana::ids::bpf_loader_deprecated();
	r = Solana::decode_program_account(token_program, direct);
	assert(r.kind == Solana::ProgramAccount::Direct);
	direct.executable = false;
	r = Solana::decode_program_account(token_program, direct);
	assert(r.kind == Solana::ProgramAccount::NotExecutable);

	/* Ordinary accounts.  */
	auto wallet = Solana::Account();
	wallet.exists = true;
	wallet.owner = Solana::ids::system_program();
	r = Solana::decode_program_account(token_program, wallet);
	assert(r.kind == Solana::ProgramAccount::NotExecutable);
	r = Solana::decode_program_account(token_program, Solana::Account());
	assert(r.kind == Solana::ProgramAccount::NotExecutable);

	/* Program data with an upgrade authority.  */
	auto authority = Solana::Pubkey(
		"AKnL4NNf3DGWZJS6cPknBuEGnVsV4A4m5tgebLHaRSZ9"
	);
	auto pd = std::vector<std::uint8_t>();
	put_u32(pd, 3);
	put_u64(pd, 123456789);
	pd.push_back(1);
	put_key(pd, authority);
	assert(pd.size() == Solana::programdata_header_size);
	pd.push_back(0x7f);
	pd.push_back('E');
	pd.push_back(0);
	auto decoded = Solana::decode_program_data(pda, upgradeable_account(pd));
	assert(decoded.deployment_slot == 123456789);
	assert(decoded.has_upgrade_authority);
	assert(decoded.upgrade_authority == authority);
	assert((decoded.executable == std::vector<std::uint8_t>{0x7f, 'E', 0}));

	/* Frozen program: no authority.  */
	pd[12] = 0;
	decoded = Solana::decode_program_data(pda, upgradeable_account(pd));
	assert(!decoded.has_upgrade_authority);
	assert(decoded.upgrade_authority == Solana::Pubkey());

	/* Header only.  */
	pd.resize(Solana::programdata_header_size);
	decoded = Solana::decode_program_data(pda, upgradeable_account(pd));
	assert(decoded.executable.empty());

	pd.resize(Solana::programdata_header_size - 1);
	assert(decode_data_fails(upgradeable_account(pd)));
	assert(decode_data_fails(upgradeable_account(data)));
	assert(decode_data_fails(Solana::Account()));
	auto foreign = upgradeable_account(std::vector<std::uint8_t>(64, 0));
	foreign.data[0] = 3;
	foreign.owner = Solana::ids::bpf_loader();
	assert(decode_data_fails(foreign));

	return 0;
}
