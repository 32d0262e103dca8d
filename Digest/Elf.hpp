#ifndef DIGEST_ELF_HPP
#define DIGEST_ELF_HPP

#include<cstddef>
#include<cstdint>
#include<string>
#include<vector>

namespace Digest { namespace Elf {

/** Digest::Elf::is_volatile_section
 *
 * @brief determines if the named section holds
 * build-environment metadata rather than code or
 * data.
 */
bool is_volatile_section(std::string const& name);

/** Digest::Elf::blank_metadata
 *
 * @brief overwrites the contents of volatile
 * sections with zero bytes, in place.
 *
 * @desc Only ELF64 little-endian images are
 * touched; anything else, including a malformed
 * ELF, is left unchanged.
 * Sizes and offsets are preserved.
 *
 * @return the number of sections blanked.
 */
std::size_t blank_metadata(std::vector<std::uint8_t>& image);

}}

#endif /* !defined(DIGEST_ELF_HPP) */
