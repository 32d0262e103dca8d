#include"Solana/Account.hpp"
#include"Solana/ChainError.hpp"
#include"Solana/LoaderState.hpp"
#include"Solana/Pda.hpp"
#include"Solana/ids.hpp"
#include"Solana/le.hpp"
#include<sstream>

namespace {

/* Upgradeable loader state tags.  */
auto constexpr tag_uninitialized = std::uint32_t(0);
auto constexpr tag_buffer = std::uint32_t(1);
auto constexpr tag_program = std::uint32_t(2);
auto constexpr tag_programdata = std::uint32_t(3);

std::string tag_name(std::uint32_t tag) {
	switch (tag) {
	case tag_uninitialized: return "uninitialized";
	case tag_buffer: return "buffer";
	case tag_program: return "program";
	case tag_programdata: return "program data";
	}
	return "unknown state " + std::to_string(tag);
}

std::uint32_t read_tag(std::vector<std::uint8_t> const& data) {
	return (std::uint32_t(data[0]) << 0)
	     | (std::uint32_t(data[1]) << 8)
	     | (std::uint32_t(data[2]) << 16)
	     | (std::uint32_t(data[3]) << 24)
	     ;
}

Solana::ProgramAccount not_executable(std::string reason) {
	return Solana::ProgramAccount{ Solana::ProgramAccount::NotExecutable
				     , Solana::Pubkey()
				     , std::move(reason)
				     };
}

}

namespace Solana {

ProgramAccount decode_program_account( Pubkey const& program_id
				     , Account const& account
				     ) {
	if (!account.exists)
		return not_executable("no account");

	if (account.owner == ids::bpf_loader_upgradeable()) {
		if (account.data.size() < 4)
			return not_executable("loader state too short");
		auto tag = read_tag(account.data);
		if (tag != tag_program)
			return not_executable( "upgradeable loader account is "
					     + tag_name(tag)
					     );
		if (account.data.size() < 4 + Pubkey::size)
			return not_executable("program state too short");

		auto stored = Pubkey::from_buffer(&account.data[4]);
		auto derived = find_program_address( {seed(program_id)}
						   , ids::bpf_loader_upgradeable()
						   ).address;
		if (stored != derived)
			return not_executable( "program data address "
					     + std::string(stored)
					     + " is not derived from the program"
					     );
		return ProgramAccount{ ProgramAccount::Upgradeable
				     , stored
				     , ""
				     };
	}

	if ( account.owner == ids::bpf_loader()
	  || account.owner == ids::bpf_loader_deprecated()
	   ) {
		if (!account.executable)
			return not_executable("loader account is not executable");
		return ProgramAccount{ ProgramAccount::Direct
				     , Pubkey()
				     , ""
				     };
	}

	return not_executable( "owned by " + std::string(account.owner)
			     + ", not a program loader"
			     );
}

ProgramData decode_program_data( Pubkey const& address
			       , Account const& account
			       ) {
	if (!account.exists)
		throw NotExecutable(address, "program data account missing");
	if (account.owner != ids::bpf_loader_upgradeable())
		throw NotExecutable( address
				   , "program data owned by "
				   + std::string(account.owner)
				   );
	if (account.data.size() < programdata_header_size)
		throw NotExecutable(address, "program data too short");
	auto tag = read_tag(account.data);
	if (tag != tag_programdata)
		throw NotExecutable( address
				   , "expected program data, found "
				   + tag_name(tag)
				   );

	auto is = std::istringstream(std::string( account.data.begin() + 4
						, account.data.begin()
						+ programdata_header_size
						));
	auto rv = ProgramData();
	is >> le(rv.deployment_slot);
	auto option = char();
	is.get(option);
	rv.has_upgrade_authority = option != 0;
	std::uint8_t authority[32];
	is.read(reinterpret_cast<char*>(authority), sizeof(authority));
	if (rv.has_upgrade_authority)
		rv.upgrade_authority = Pubkey::from_buffer(authority);

	rv.executable.assign( account.data.begin() + programdata_header_size
			    , account.data.end()
			    );
	return rv;
}

}
