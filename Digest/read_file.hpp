#ifndef DIGEST_READ_FILE_HPP
#define DIGEST_READ_FILE_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Digest {

class ReadError : public Util::BacktraceException<std::runtime_error> {
public:
	ReadError(std::string const& msg
		 ) : Util::BacktraceException<std::runtime_error>(msg) { }
};

/** Digest::read_file
 *
 * @brief loads an entire binary file.
 */
std::vector<std::uint8_t> read_file(std::string const& path);

}

#endif /* !defined(DIGEST_READ_FILE_HPP) */
