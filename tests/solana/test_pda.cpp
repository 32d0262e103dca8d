#undef NDEBUG
#include"Solana/Pda.hpp"
#include"Solana/ids.hpp"
#include<assert.h>
#include<sodium/core.h>
#include<stdexcept>

namespace {

std::string create(std::vector<Solana::Seed> const& seeds, Solana::Pubkey const& program) {
	auto out = Solana::Pubkey();
	assert(Solana::create_program_address(out, seeds, program));
	return std::string(out);
}

}

int main() {
	assert(sodium_init() >= 0);

	auto loader1 = Solana::ids::bpf_loader_deprecated();
	auto upgradeable = Solana::ids::bpf_loader_upgradeable();

	/* Known addresses.  */
	assert(create({Solana::seed(""), {1}}, loader1) == "3gF2KMe9KiC6FNVBmfg9i267aMPvK37FewCip4eGBFcT");
	assert(create({Solana::seed("\xe2\x98\x89")}, loader1) == "7ytmC1nT1xY4RfxCV2ZgyA7UakC93do5ZdyhdF3EtPj7");
	assert(create({Solana::seed("Talking"), Solana::seed("Squirrels")}, loader1) == "HwRVBufQ4haG5XSgpspwKtNd3PC9GM9m1196uJW36vds");
	auto seed_key = Solana::Pubkey("SeedPubey1111111111111111111111111111111111");
	assert(create({Solana::seed(seed_key)}, loader1) == "GUs5qLUfsEHkcMB9T38vjr18ypEhRuNWiePW2LoK4E3K");

	/* Program data addresses.  */
	auto token = Solana::Pubkey("TokenkegQfeZyiNwAJbNbGkPWKe5nVsXdTgHRRvy3i1YQzZ");
	auto pd = Solana::find_program_address({Solana::seed(token)}, upgradeable);
	assert(std::string(pd.address) == "FasEiG8vYccazKrgdRf8KJ2ZnqajRNwQZfJ1RqaDdiu1");
	assert(pd.bump == 255);
	assert(!pd.address.is_on_curve());

	/* Bumps 255 and 254 land on the curve here.  */
	auto system = Solana::ids::system_program();
	pd = Solana::find_program_address({Solana::seed(system)}, upgradeable);
	assert(std::string(pd.address) == "5ReXsszTZPmCZuH7wHPoEkxqRq3Bb1xWWcim13zDH6LX");
	assert(pd.bump == 253);
	auto out = Solana::Pubkey();
	assert(!Solana::create_program_address(out, {Solana::seed(system), {255}}, upgradeable));
	assert(!Solana::create_program_address(out, {Solana::seed(system), {254}}, upgradeable));
	assert(out == Solana::Pubkey());
	assert(Solana::create_program_address(out, {Solana::seed(system), {253}}, upgradeable));
	assert(out == pd.address);

	/* Ordinary keys are on the curve.  */
	assert(Solana::Pubkey("AKnL4NNf3DGWZJS6cPknBuEGnVsV4A4m5tgebLHaRSZ9").is_on_curve());

	/* Seed limits.  */
	auto flag = false;
	try {
		Solana::find_program_address({Solana::Seed(33, 0)}, upgradeable);
	} catch (std::invalid_argument const&) {
		flag = true;
	}
	assert(flag);
	flag = false;
	try {
		/* The bump takes the sixteenth place.  */
		Solana::find_program_address(std::vector<Solana::Seed>(16), upgradeable);
	} catch (std::invalid_argument const&) {
		flag = true;
	}
	assert(flag);
	(void) Solana::find_program_address(std::vector<Solana::Seed>(15), upgradeable);
	(void) Solana::create_program_address(out, std::vector<Solana::Seed>(16), upgradeable);

	return 0;
}
