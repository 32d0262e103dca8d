#ifndef DIGEST_CANONICALIZE_AND_HASH_HPP
#define DIGEST_CANONICALIZE_AND_HASH_HPP

#include"Digest/Policy.hpp"
#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Digest {

/** struct Digest::Canonical
 *
 * @brief canonicalized bytes and their digest.
 */
struct Canonical {
	std::vector<std::uint8_t> bytes;
	Sha256::Hash digest;
};

/** Digest::canonicalize
 *
 * @brief applies the canonicalization rules of the
 * policy.
 *
 * @desc A fixed point: canonicalizing canonical
 * bytes returns them unchanged.
 */
std::vector<std::uint8_t>
canonicalize( std::vector<std::uint8_t> raw
	    , Digest::Policy const& policy = Digest::Policy()
	    );

/** Digest::canonicalize_and_hash
 *
 * @brief canonicalizes the bytes, then computes the
 * SHA-256 of the result.
 *
 * @desc A pure function of its inputs.
 * `std::string(digest)` renders 64 lower-case hex
 * characters.
 */
Canonical
canonicalize_and_hash( std::vector<std::uint8_t> raw
		     , Digest::Policy const& policy = Digest::Policy()
		     );

/** Digest::hash_file
 *
 * @brief reads a local binary and returns its
 * canonical digest.
 *
 * @desc Throws `Digest::ReadError` if the file
 * cannot be read.
 */
Canonical
hash_file( std::string const& path
	 , Digest::Policy const& policy = Digest::Policy()
	 );

}

#endif /* !defined(DIGEST_CANONICALIZE_AND_HASH_HPP) */
