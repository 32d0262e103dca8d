#include"Digest/Elf.hpp"
#include"Digest/canonicalize_and_hash.hpp"
#include"Digest/read_file.hpp"
#include"Sha256/fun.hpp"

namespace Digest {

std::vector<std::uint8_t>
canonicalize( std::vector<std::uint8_t> bytes
	    , Digest::Policy const& policy
	    ) {
	if (policy.blank_elf_metadata)
		(void) Elf::blank_metadata(bytes);
	if (policy.trim_trailing_zeros) {
		auto end = bytes.size();
		while (end > 0 && bytes[end - 1] == 0)
			--end;
		bytes.resize(end);
	}
	return bytes;
}

Canonical
canonicalize_and_hash( std::vector<std::uint8_t> raw
		     , Digest::Policy const& policy
		     ) {
	auto rv = Canonical();
	rv.bytes = canonicalize(std::move(raw), policy);
	rv.digest = Sha256::fun(rv.bytes.data(), rv.bytes.size());
	return rv;
}

Canonical
hash_file( std::string const& path
	 , Digest::Policy const& policy
	 ) {
	return canonicalize_and_hash(read_file(path), policy);
}

}
