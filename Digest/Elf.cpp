#include"Digest/Elf.hpp"
#include<algorithm>

namespace {

auto const ehdr_size = std::size_t(64);
auto const shdr_size = std::size_t(64);
auto const sht_nobits = std::uint32_t(8);

std::uint64_t read_le( std::vector<std::uint8_t> const& b
		     , std::size_t off
		     , std::size_t len
		     ) {
	auto rv = std::uint64_t(0);
	for (auto i = std::size_t(0); i < len; ++i)
		rv |= std::uint64_t(b[off + i]) << (8 * i);
	return rv;
}

struct SectionHeader {
	std::uint32_t name;
	std::uint32_t type;
	std::uint64_t offset;
	std::uint64_t size;
};

SectionHeader read_shdr( std::vector<std::uint8_t> const& b
		       , std::size_t off
		       ) {
	auto rv = SectionHeader();
	rv.name = std::uint32_t(read_le(b, off + 0, 4));
	rv.type = std::uint32_t(read_le(b, off + 4, 4));
	rv.offset = read_le(b, off + 24, 8);
	rv.size = read_le(b, off + 32, 8);
	return rv;
}

/* Names must be NUL-terminated inside the string
 * table, otherwise they match nothing.  */
bool read_name( std::vector<std::uint8_t> const& b
	      , SectionHeader const& strtab
	      , std::uint32_t name_off
	      , std::string& name
	      ) {
	auto end = std::min<std::uint64_t>( strtab.offset + strtab.size
					  , b.size()
					  );
	auto p = strtab.offset + name_off;
	if (name_off >= strtab.size || p >= end)
		return false;
	name.clear();
	for (; p < end; ++p) {
		if (b[p] == 0)
			return true;
		name.push_back(char(b[p]));
	}
	return false;
}

}

namespace Digest { namespace Elf {

bool is_volatile_section(std::string const& name) {
	if ( name == ".comment"
	  || name == ".note.gnu.build-id"
	  || name == ".note.gnu.gold-version"
	  || name == ".gnu_debuglink"
	   )
		return true;
	return name.compare(0, 7, ".debug_") == 0;
}

std::size_t blank_metadata(std::vector<std::uint8_t>& b) {
	if (b.size() < ehdr_size)
		return 0;
	if (b[0] != 0x7F || b[1] != 'E' || b[2] != 'L' || b[3] != 'F')
		return 0;
	/* ELFCLASS64, ELFDATA2LSB.  */
	if (b[4] != 2 || b[5] != 1)
		return 0;

	auto shoff = read_le(b, 0x28, 8);
	auto shentsize = read_le(b, 0x3A, 2);
	auto shnum = read_le(b, 0x3C, 2);
	auto shstrndx = read_le(b, 0x3E, 2);

	if (shnum == 0 || shentsize != shdr_size || shstrndx >= shnum)
		return 0;
	if (shoff > b.size() || shnum * shdr_size > b.size() - shoff)
		return 0;

	auto strtab = read_shdr(b, shoff + shstrndx * shdr_size);
	if (strtab.type == sht_nobits || strtab.offset >= b.size())
		return 0;

	auto count = std::size_t(0);
	auto name = std::string();
	for (auto i = std::uint64_t(0); i < shnum; ++i) {
		auto sh = read_shdr(b, shoff + i * shdr_size);
		if (sh.type == sht_nobits || sh.size == 0)
			continue;
		if (!read_name(b, strtab, sh.name, name))
			continue;
		if (!is_volatile_section(name))
			continue;
		if (sh.offset >= b.size())
			continue;
		auto end = sh.offset + std::min<std::uint64_t>( sh.size
							      , b.size() - sh.offset
							      );
		std::fill(b.begin() + sh.offset, b.begin() + end, 0);
		++count;
	}
	return count;
}

}}
