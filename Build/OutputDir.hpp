#ifndef BUILD_OUTPUTDIR_HPP
#define BUILD_OUTPUTDIR_HPP

#include<string>

namespace Build {

/** class Build::OutputDir
 *
 * @brief a private temporary directory owned by a
 * single invocation.
 *
 * @desc Created with `mkdtemp` on construction and
 * removed recursively on destruction, unless
 * `retain` was called.
 * The path is always absolute, even when
 * `$TMPDIR` is relative.
 * Throws `Build::ConfigError` if the directory
 * cannot be created.
 */
class OutputDir {
private:
	std::string path;
	bool retained;

public:
	OutputDir(OutputDir const&) =delete;
	OutputDir(OutputDir&&) =delete;

	/* Creates `<parent>/<prefix>XXXXXX`.
	 * An empty parent means `$TMPDIR`, or `/tmp`.  */
	explicit
	OutputDir( std::string const& parent = ""
		 , std::string const& prefix = "reprove-"
		 );
	~OutputDir();

	std::string const& get() const { return path; }

	/* Keep the directory after destruction.  */
	void retain() { retained = true; }
	bool is_retained() const { return retained; }

	/** Build::OutputDir::remove
	 *
	 * @brief removes the directory now instead of
	 * at destruction.
	 *
	 * @return false if anything could not be
	 * removed, so the caller can report what is
	 * left behind.
	 * Does nothing and returns true if retained.
	 */
	bool remove();
};

/** Build::remove_tree
 *
 * @brief removes a directory and everything under
 * it, without following symlinks.
 *
 * @return false if anything could not be removed.
 */
bool remove_tree(std::string const& path);

/** Build::absolute_path
 *
 * @brief resolves a path to an absolute one with
 * no symlinks, `.` or `..` components.
 *
 * @desc Throws `Build::ConfigError` if the path
 * does not exist.
 */
std::string absolute_path(std::string const& path);

}

#endif /* !defined(BUILD_OUTPUTDIR_HPP) */
