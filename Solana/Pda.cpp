#include"Solana/Pda.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace {

auto constexpr max_seeds = std::size_t(16);
auto constexpr max_seed_length = std::size_t(32);
char const marker[] = "ProgramDerivedAddress";

void check_seeds( std::vector<Solana::Seed> const& seeds
		, std::size_t limit
		) {
	if (seeds.size() > limit)
		throw Util::BacktraceException<std::invalid_argument>(
			"Too many seeds for a program address"
		);
	for (auto const& s : seeds)
		if (s.size() > max_seed_length)
			throw Util::BacktraceException<std::invalid_argument>(
				"Program address seed longer than 32 bytes"
			);
}

Solana::Pubkey hash_address( std::vector<Solana::Seed> const& seeds
			   , std::uint8_t const* bump
			   , Solana::Pubkey const& program_id
			   ) {
	auto hasher = Sha256::Hasher();
	for (auto const& s : seeds)
		hasher.feed(s.data(), s.size());
	if (bump)
		hasher.feed(bump, 1);
	hasher.feed(program_id.data(), Solana::Pubkey::size);
	hasher.feed(marker, sizeof(marker) - 1);

	std::uint8_t buf[32];
	std::move(hasher).finalize().to_buffer(buf);
	return Solana::Pubkey::from_buffer(buf);
}

}

namespace Solana {

bool create_program_address( Pubkey& out
			   , std::vector<Seed> const& seeds
			   , Pubkey const& program_id
			   ) {
	check_seeds(seeds, max_seeds);
	auto addr = hash_address(seeds, nullptr, program_id);
	if (addr.is_on_curve())
		return false;
	out = addr;
	return true;
}

ProgramAddress find_program_address( std::vector<Seed> const& seeds
				   , Pubkey const& program_id
				   ) {
	/* One slot is reserved for the bump.  */
	check_seeds(seeds, max_seeds - 1);
	for (auto bump = 255; bump >= 0; --bump) {
		auto b = std::uint8_t(bump);
		auto addr = hash_address(seeds, &b, program_id);
		if (!addr.is_on_curve())
			return ProgramAddress{addr, b};
	}
	/* Each bump has roughly even odds, so this is
	 * practically unreachable.  */
	throw Util::BacktraceException<std::runtime_error>(
		"No off-curve program address for these seeds"
	);
}

}
