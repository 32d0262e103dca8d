#undef NDEBUG
#include"Digest/Elf.hpp"
#include"Digest/canonicalize_and_hash.hpp"
#include"Digest/read_file.hpp"
#include"Sha256/fun.hpp"
#include<assert.h>
#include<fstream>
#include<stdio.h>

namespace {

typedef std::vector<std::uint8_t> Bytes;

void put_le(Bytes& b, std::size_t off, std::uint64_t v, std::size_t len) {
	for (auto i = std::size_t(0); i < len; ++i)
		b[off + i] = std::uint8_t(v >> (8 * i));
}

void put_shdr( Bytes& b, std::size_t off
	     , std::uint32_t name, std::uint32_t type
	     , std::uint64_t offset, std::uint64_t size
	     ) {
	put_le(b, off + 0, name, 4);
	put_le(b, off + 4, type, 4);
	put_le(b, off + 24, offset, 8);
	put_le(b, off + 32, size, 8);
	/* Non-zero alignment, so the table does not end
	 * in zeros.  */
	put_le(b, off + 48, 1, 8);
}

/* A minimal ELF64 image with .text, .comment and
 * .shstrtab sections.  */
Bytes make_elf(std::string const& text, std::string const& comment) {
	auto strtab = std::string("\0.text\0.comment\0.shstrtab\0", 26);
	auto text_off = std::size_t(64);
	auto comment_off = text_off + text.size();
	auto strtab_off = comment_off + comment.size();
	auto shoff = strtab_off + strtab.size();
	auto b = Bytes(shoff + 4 * 64, 0);

	b[0] = 0x7F; b[1] = 'E'; b[2] = 'L'; b[3] = 'F';
	b[4] = 2; b[5] = 1; b[6] = 1;
	put_le(b, 0x28, shoff, 8);
	put_le(b, 0x3A, 64, 2);
	put_le(b, 0x3C, 4, 2);
	put_le(b, 0x3E, 3, 2);

	std::copy(text.begin(), text.end(), b.begin() + text_off);
	std::copy(comment.begin(), comment.end(), b.begin() + comment_off);
	std::copy(strtab.begin(), strtab.end(), b.begin() + strtab_off);

	put_shdr(b, shoff + 64, 1, 1, text_off, text.size());
	put_shdr(b, shoff + 128, 7, 1, comment_off, comment.size());
	put_shdr(b, shoff + 192, 16, 3, strtab_off, strtab.size());
	return b;
}

Bytes bytes(std::string const& s) {
	return Bytes(s.begin(), s.end());
}

}

int main() {
	auto policy = Digest::Policy();
	auto raw = Digest::Policy();
	raw.blank_elf_metadata = false;
	raw.trim_trailing_zeros = false;

	/* Trailing zeros are padding.  */
	auto padded = bytes(std::string("code\0\0\0\0", 8));
	assert(Digest::canonicalize(padded) == bytes("code"));
	assert( Digest::canonicalize_and_hash(padded).digest
	     == Sha256::fun("code", 4)
	      );
	assert(Digest::canonicalize(padded, raw) == padded);
	assert(Digest::canonicalize(Bytes(5, 0)).empty());
	assert( std::string(Digest::canonicalize_and_hash(Bytes()).digest)
	     == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"
	      );

	/* Non-ELF input is only trimmed.  */
	auto not_elf = bytes("\x7f" "ELG not an elf at all, but long enough to look like a header.......");
	assert(Digest::canonicalize(not_elf) == not_elf);

	/* Volatile sections do not affect the digest.  */
	auto e1 = make_elf("CODE", "GCC: v1");
	auto e2 = make_elf("CODE", "GCC: v2");
	auto e3 = make_elf("C0DE", "GCC: v1");
	{
		auto copy = e1;
		assert(Digest::Elf::blank_metadata(copy) == 1);
		assert(copy.size() == e1.size());
		assert(std::string(copy.begin() + 64, copy.begin() + 68) == "CODE");
		assert(std::string(copy.begin() + 68, copy.begin() + 75) == std::string(7, '\0'));
	}
	auto d1 = Digest::canonicalize_and_hash(e1, policy).digest;
	auto d2 = Digest::canonicalize_and_hash(e2, policy).digest;
	auto d3 = Digest::canonicalize_and_hash(e3, policy).digest;
	assert(d1 == d2);
	assert(d1 != d3);

	/* Unless blanking is disabled.  */
	auto noblank = Digest::Policy();
	noblank.blank_elf_metadata = false;
	assert( Digest::canonicalize_and_hash(e1, noblank).digest
	     != Digest::canonicalize_and_hash(e2, noblank).digest
	      );

	/* Fixed point.  */
	for (auto const& input : {padded, not_elf, e1, e2, e3}) {
		auto once = Digest::canonicalize(input, policy);
		assert(Digest::canonicalize(once, policy) == once);
		assert( Digest::canonicalize_and_hash(once, policy).digest
		     == Digest::canonicalize_and_hash(input, policy).digest
		      );
	}

	/* Truncated section table leaves the image alone.  */
	auto truncated = Bytes(e1.begin(), e1.end() - 10);
	assert(Digest::Elf::blank_metadata(truncated) == 0);

	assert(Digest::Elf::is_volatile_section(".debug_info"));
	assert(Digest::Elf::is_volatile_section(".note.gnu.build-id"));
	assert(!Digest::Elf::is_volatile_section(".text"));
	assert(!Digest::Elf::is_volatile_section(".rodata"));

	/* hash_file.  */
	auto path = std::string("test_canonicalize.tmp");
	{
		auto os = std::ofstream(path, std::ios::binary);
		os.write((char const*) e1.data(), e1.size());
	}
	assert(Digest::hash_file(path, policy).digest == d1);
	assert(Digest::read_file(path) == e1);
	remove(path.c_str());

	auto flag = false;
	try {
		Digest::hash_file("/nonexistent/file.so");
	} catch (Digest::ReadError const&) {
		flag = true;
	}
	assert(flag);

	return 0;
}
