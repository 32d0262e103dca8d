#include"Build/Error.hpp"
#include"Build/OutputDir.hpp"
#include<errno.h>
#include<ftw.h>
#include<stdio.h>
#include<stdlib.h>
#include<string.h>
#include<unistd.h>
#include<vector>

namespace {

bool remove_ok;

int remove_entry( char const* fpath, struct stat const* sb
		, int typeflag, struct FTW* ftwbuf
		) {
	if (remove(fpath) < 0)
		remove_ok = false;
	/* Keep going, remove as much as we can.  */
	return 0;
}

}

namespace Build {

OutputDir::OutputDir( std::string const& parent_
		    , std::string const& prefix
		    ) : retained(false) {
	auto parent = parent_;
	if (parent.empty()) {
		auto tmpdir = getenv("TMPDIR");
		parent = (tmpdir && *tmpdir) ? tmpdir : "/tmp";
	}
	auto tpl = parent + "/" + prefix + "XXXXXX";
	auto buf = std::vector<char>(tpl.begin(), tpl.end());
	buf.push_back(0);
	if (!mkdtemp(&buf[0]))
		throw ConfigError( "Cannot create temporary directory in "
				 + parent + ": " + strerror(errno)
				 );
	path = absolute_path(std::string(&buf[0]));
}

OutputDir::~OutputDir() {
	/* Normally already done by remove(), which
	 * is where failures get reported.  */
	if (!retained && !path.empty())
		remove_tree(path);
}

bool OutputDir::remove() {
	if (retained || path.empty())
		return true;
	auto ok = remove_tree(path);
	path.clear();
	return ok;
}

bool remove_tree(std::string const& path) {
	remove_ok = true;
	auto res = nftw( path.c_str(), &remove_entry, 16
		       , FTW_DEPTH | FTW_PHYS
		       );
	return res == 0 && remove_ok;
}

std::string absolute_path(std::string const& path) {
	auto res = realpath(path.c_str(), nullptr);
	if (!res)
		throw ConfigError( "Cannot resolve " + path + ": "
				 + strerror(errno)
				 );
	auto rv = std::string(res);
	free(res);
	return rv;
}

}
