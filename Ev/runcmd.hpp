#ifndef EV_RUNCMD_HPP
#define EV_RUNCMD_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** struct Ev::RunCmdResult
 *
 * @brief the exit code and the captured output of
 * a command that ran to completion.
 *
 * @desc `exit_code` is the exit status of the
 * command if it exited normally, or 128 plus the
 * signal number if it was killed by a signal.
 */
struct RunCmdResult {
	int exit_code;
	std::string output;
};

/** class Ev::RunCmdError
 *
 * @brief thrown by `Ev::runcmd` if the command could
 * not be launched or exited with a non-zero code.
 */
class RunCmdError : public Util::BacktraceException<std::runtime_error> {
public:
	int const exit_code;
	std::string const output;

	RunCmdError( std::string const& msg
		   , int exit_code_ = -1
		   , std::string output_ = ""
		   ) : Util::BacktraceException<std::runtime_error>(msg)
		     , exit_code(exit_code_)
		     , output(std::move(output_))
		     { }
};

/** Ev::runcmd_status
 *
 * @brief run the given command, and returns its
 * exit code and its output.
 *
 * @desc This action does not return until the
 * given command closes its stdout *and* the
 * command process has terminated.
 * All output is returned in the result.
 * Its input is redirected from `/dev/null`.
 *
 * stderr may be captured in the same pipe as
 * stdout, or may be preserved to be the same
 * as in the current process.
 *
 * A non-zero exit code is *not* an error for
 * this action; failure to launch the command
 * is, and throws `Ev::RunCmdError`.
 */
Ev::Io<RunCmdResult> runcmd_status( std::string command
				  , std::vector<std::string> argv
				  , bool capture_stderr = false
				  );

/** Ev::runcmd
 *
 * @brief like `Ev::runcmd_status`, but returns
 * only the output, and throws `Ev::RunCmdError`
 * if the command exits with a non-zero code.
 */
Ev::Io<std::string> runcmd( std::string command
			  , std::vector<std::string> argv
			  , bool capture_stderr = false
			  );

}

#endif /* !defined(EV_RUNCMD_HPP) */
