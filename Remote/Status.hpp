#ifndef REMOTE_STATUS_HPP
#define REMOTE_STATUS_HPP

#include<string>

namespace Remote {

/** enum Remote::Status
 *
 * @brief the lifecycle of a remote job.
 *
 * @desc `Succeeded` and `Failed` are terminal.
 * `TimedOut` is never reported by the worker; it is
 * given to a local snapshot when waiting gave up.
 * `Unknown` stands for any status string this
 * version does not recognize.
 */
enum Status {
	Queued,
	Building,
	Verifying,
	Succeeded,
	Failed,
	TimedOut,
	Unknown
};

char const* status_name(Status s);
/* Unrecognized strings give `Unknown`.  */
Status parse_status(std::string const& s);

inline
bool is_terminal(Status s) {
	return s == Succeeded || s == Failed;
}

}

#endif /* !defined(REMOTE_STATUS_HPP) */
