#ifndef DIGEST_POLICY_HPP
#define DIGEST_POLICY_HPP

namespace Digest {

/** struct Digest::Policy
 *
 * @brief selects the canonicalization rules applied
 * before hashing.
 *
 * @desc Both rules are on by default.
 */
struct Policy {
	/* Zero the contents of ELF sections that vary
	 * with the build environment.  */
	bool blank_elf_metadata;
	/* Drop trailing zero bytes.  */
	bool trim_trailing_zeros;

	Policy() : blank_elf_metadata(true)
		 , trim_trailing_zeros(true)
		 { }
};

}

#endif /* !defined(DIGEST_POLICY_HPP) */
