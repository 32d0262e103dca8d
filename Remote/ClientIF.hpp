#ifndef REMOTE_CLIENTIF_HPP
#define REMOTE_CLIENTIF_HPP

#include<string>

namespace Ev { template<typename a> class Io; }
namespace Remote { struct Job; }
namespace Remote { struct JobParams; }

namespace Remote {

/** class Remote::ClientIF
 *
 * @brief the remote verification worker API.
 */
class ClientIF {
public:
	virtual ~ClientIF() { }

	/* Sends the job once.  Returns the job id, or
	 * throws `Remote::SubmissionError`.  */
	virtual
	Ev::Io<std::string> submit(JobParams const& params) =0;

	/* Fills in the worker-reported fields of `job`,
	 * whose `job_id` must be set.  Throws
	 * `Remote::UnknownJob` or `Remote::RemoteError`.  */
	virtual
	Ev::Io<Job> get_job(Job job) =0;
};

}

#endif /* !defined(REMOTE_CLIENTIF_HPP) */
