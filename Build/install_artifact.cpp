#include"Build/Artifact.hpp"
#include"Build/Error.hpp"
#include"Build/install_artifact.hpp"
#include"Digest/read_file.hpp"
#include"Net/Fd.hpp"
#include"Util/Rw.hpp"
#include<errno.h>
#include<fcntl.h>
#include<stdio.h>
#include<string.h>
#include<sys/stat.h>
#include<unistd.h>

namespace {

void ensure_dir(std::string const& path) {
	if (mkdir(path.c_str(), 0755) < 0 && errno != EEXIST)
		throw Build::BuildFailure( "Cannot create " + path + ": "
					 + strerror(errno)
					 , 0, ""
					 );
}

}

namespace Build {

std::string install_artifact( Build::Artifact const& artifact
			    , std::string const& crate_dir
			    ) {
	auto bytes = std::vector<std::uint8_t>();
	try {
		bytes = Digest::read_file(artifact.raw_path);
	} catch (Digest::ReadError const& e) {
		throw BuildFailure(e.what(), 0, "");
	}

	ensure_dir(crate_dir + "/target");
	ensure_dir(crate_dir + "/target/deploy");
	auto dest = crate_dir + "/target/deploy/"
		  + artifact.binary_name + ".so"
		  ;
	/* Write beside, then rename into place.  */
	auto tmp = dest + ".tmp";
	{
		auto fd = Net::Fd(open( tmp.c_str()
				      , O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC
				      , 0644
				      ));
		if (!fd)
			throw BuildFailure( "Cannot create " + tmp + ": "
					  + strerror(errno)
					  , 0, ""
					  );
		if (!Util::Rw::write_all(fd.get(), bytes.data(), bytes.size()))
			throw BuildFailure( "Cannot write " + tmp + ": "
					  + strerror(errno)
					  , 0, ""
					  );
	}
	if (rename(tmp.c_str(), dest.c_str()) < 0) {
		auto err = errno;
		unlink(tmp.c_str());
		throw BuildFailure( "Cannot rename to " + dest + ": "
				  + strerror(err)
				  , 0, ""
				  );
	}
	return dest;
}

}
