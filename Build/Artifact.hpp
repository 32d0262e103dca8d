#ifndef BUILD_ARTIFACT_HPP
#define BUILD_ARTIFACT_HPP

#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>

namespace Build {

/** struct Build::Artifact
 *
 * @brief the binary produced by one build.
 *
 * @desc `raw_path` lies inside the output directory
 * of the invocation that built it, and is gone once
 * that directory is removed.
 * `digest` is the canonical digest of the file.
 */
struct Artifact {
	std::string raw_path;
	Sha256::Hash digest;
	std::uint64_t size;

	/* Provenance, for reports.  */
	std::string binary_name;
	std::string image;
	std::string commit;
};

}

#endif /* !defined(BUILD_ARTIFACT_HPP) */
