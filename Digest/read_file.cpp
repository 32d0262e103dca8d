#include"Digest/read_file.hpp"
#include"Net/Fd.hpp"
#include"Util/Rw.hpp"
#include<errno.h>
#include<fcntl.h>
#include<string.h>
#include<sys/stat.h>
#include<unistd.h>

namespace Digest {

std::vector<std::uint8_t> read_file(std::string const& path) {
	auto fd = Net::Fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
	if (!fd)
		throw ReadError( "Cannot open " + path + ": "
			       + strerror(errno)
			       );

	struct stat st;
	if (fstat(fd.get(), &st) < 0)
		throw ReadError( "Cannot stat " + path + ": "
			       + strerror(errno)
			       );
	if (!S_ISREG(st.st_mode))
		throw ReadError(path + ": not a regular file");

	auto rv = std::vector<std::uint8_t>(std::size_t(st.st_size));
	auto size = rv.size();
	/* Fails on early EOF too, i.e. if the file
	 * shrank while we were reading.  */
	if (size != 0 && !Util::Rw::read_all(fd.get(), rv.data(), size))
		throw ReadError("Cannot read " + path);
	return rv;
}

}
