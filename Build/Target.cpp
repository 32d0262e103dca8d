#include"Build/Error.hpp"
#include"Build/Target.hpp"

namespace Build {

Target::Target( std::string toolchain_version_
	      , std::string repo_url_
	      , std::string commit_ref_
	      , std::string crate_subpath_
	      , std::string binary_name_
	      , std::map<std::string, std::string> build_flags_
	      ) : toolchain_version(std::move(toolchain_version_))
		, repo_url(std::move(repo_url_))
		, commit_ref(std::move(commit_ref_))
		, crate_subpath(std::move(crate_subpath_))
		, binary_name(std::move(binary_name_))
		, build_flags(std::move(build_flags_))
		{
	if (repo_url.empty())
		throw ConfigError("Build target needs a repository");
	/* Passed to git as is, so never an option.  */
	if (!commit_ref.empty() && commit_ref[0] == '-')
		throw ConfigError( "Invalid commit: '"
				 + commit_ref + "'"
				 );
	for (auto const& f : build_flags) {
		if (!valid_flag_key(f.first))
			throw ConfigError( "Invalid build flag name: '"
					 + f.first + "'"
					 );
		if (!valid_flag_value(f.second))
			throw ConfigError( "Invalid value for build flag "
					 + f.first
					 );
	}
	/* Mounted under /build, so no escaping it.  */
	if ( crate_subpath.size() > 0
	  && ( crate_subpath[0] == '/'
	    || crate_subpath == ".."
	    || crate_subpath.find("../") != std::string::npos
	     ))
		throw ConfigError( "Invalid mount path: '"
				 + crate_subpath + "'"
				 );
}

Target Target::with_toolchain_version(std::string v) const {
	return Target( std::move(v), repo_url, commit_ref
		     , crate_subpath, binary_name, build_flags
		     );
}

std::vector<std::string> Target::flag_arguments() const {
	auto rv = std::vector<std::string>();
	for (auto const& f : build_flags) {
		rv.push_back("--" + f.first);
		if (!f.second.empty())
			rv.push_back(f.second);
	}
	return rv;
}

bool Target::valid_flag_key(std::string const& k) {
	if (k.empty())
		return false;
	for (auto c : k) {
		if ('a' <= c && c <= 'z')
			continue;
		if ('0' <= c && c <= '9')
			continue;
		if (c == '-')
			continue;
		return false;
	}
	return true;
}
bool Target::valid_flag_value(std::string const& v) {
	for (auto c : v)
		if ((unsigned char)c < 0x20 || c == 0x7F)
			return false;
	return true;
}

}
