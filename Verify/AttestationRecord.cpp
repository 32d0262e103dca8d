#include"Sha256/fun.hpp"
#include"Solana/ids.hpp"
#include"Solana/le.hpp"
#include"Verify/AttestationRecord.hpp"
#include<sstream>
#include<string.h>

namespace {

void write_bytes(std::ostream& os, std::uint8_t const* p, std::size_t len) {
	os.write(reinterpret_cast<char const*>(p), len);
}
void write_digest(std::ostream& os, Sha256::Hash const& h) {
	std::uint8_t buf[32];
	h.to_buffer(buf);
	write_bytes(os, buf, sizeof(buf));
}

std::vector<std::uint8_t> to_vector(std::string const& s) {
	return std::vector<std::uint8_t>(s.begin(), s.end());
}

}

namespace Verify {

std::vector<std::uint8_t> discriminator(std::string const& name) {
	std::uint8_t buf[32];
	Sha256::fun(name).to_buffer(buf);
	return std::vector<std::uint8_t>(buf, buf + 8);
}

std::vector<std::uint8_t> AttestationRecord::encode() const {
	auto os = std::ostringstream();
	auto disc = discriminator("account:Attestation");
	write_bytes(os, disc.data(), disc.size());
	write_bytes(os, program_id.data(), Solana::Pubkey::size);
	write_digest(os, digest);
	write_bytes(os, signer.data(), Solana::Pubkey::size);
	os << Solana::le(slot)
	   << Solana::le(timestamp)
	   ;
	return to_vector(os.str());
}

bool AttestationRecord::decode( AttestationRecord& out
			      , std::vector<std::uint8_t> const& data
			      ) {
	if (data.size() < size)
		return false;
	auto disc = discriminator("account:Attestation");
	if (memcmp(data.data(), disc.data(), disc.size()) != 0)
		return false;

	auto p = data.data() + disc.size();
	auto rv = AttestationRecord();
	rv.program_id = Solana::Pubkey::from_buffer(p);
	p += 32;
	rv.digest.from_buffer(p);
	p += 32;
	rv.signer = Solana::Pubkey::from_buffer(p);
	p += 32;

	auto is = std::istringstream(std::string(p, p + 16));
	is >> Solana::le(rv.slot)
	   >> Solana::le(rv.timestamp)
	   ;
	out = rv;
	return true;
}

Solana::ProgramAddress attestation_address( Solana::Pubkey const& registry
					  , Solana::Pubkey const& program_id
					  , Solana::Pubkey const& signer
					  ) {
	return Solana::find_program_address( { Solana::seed("attest")
					     , Solana::seed(program_id)
					     , Solana::seed(signer)
					     }
					   , registry
					   );
}

Solana::Instruction attest_instruction( Solana::Pubkey const& registry
				      , Solana::Pubkey const& program_id
				      , Solana::Pubkey const& signer
				      , Sha256::Hash const& digest
				      , std::uint64_t slot
				      ) {
	auto address = attestation_address(registry, program_id, signer)
		.address;

	auto os = std::ostringstream();
	auto disc = discriminator("global:attest");
	write_bytes(os, disc.data(), disc.size());
	write_digest(os, digest);
	os << Solana::le(slot);

	auto rv = Solana::Instruction();
	rv.program_id = registry;
	rv.accounts = { {address, false, true}
		      , {program_id, false, false}
		      , {signer, true, true}
		      , {Solana::ids::system_program(), false, false}
		      };
	rv.data = to_vector(os.str());
	return rv;
}

}
