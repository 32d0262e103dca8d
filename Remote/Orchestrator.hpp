#ifndef REMOTE_ORCHESTRATOR_HPP
#define REMOTE_ORCHESTRATOR_HPP

#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Remote { class ClientIF; }
namespace Remote { class JobStore; }
namespace Remote { struct Job; }
namespace Remote { struct JobParams; }
namespace Reprove { namespace Mod { class Waiter; }}
namespace S { class Bus; }

namespace Remote {

/** class Remote::Orchestrator
 *
 * @brief submits verification jobs to a remote
 * worker and follows them to completion.
 */
class Orchestrator {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Orchestrator() =delete;
	Orchestrator(Orchestrator const&) =delete;

	Orchestrator( S::Bus& bus
		    , ClientIF& client
		    , JobStore& store
		    , Reprove::Mod::Waiter& waiter
		    );
	~Orchestrator();

	/** Remote::Orchestrator::submit
	 *
	 * @brief submit a job, exactly one request, and
	 * record it as queued.
	 */
	Ev::Io<std::string> submit(JobParams params);

	/** Remote::Orchestrator::poll
	 *
	 * @brief get the current snapshot of the job.
	 *
	 * @desc Only one poll per job is in flight at a
	 * time.  Once a terminal snapshot is known,
	 * locally or in the store, it is returned as is
	 * without asking the worker.
	 */
	Ev::Io<Job> poll(std::string job_id);

	/** Remote::Orchestrator::wait
	 *
	 * @brief poll until the job is terminal, backing
	 * off from 2 seconds, doubling up to 30 seconds.
	 *
	 * @desc After `timeout` seconds the last snapshot
	 * is returned with status `TimedOut`.
	 * Poll failures other than `UnknownJob` are
	 * logged and retried.
	 * A shutdown stops the wait with
	 * `Reprove::Shutdown`; the remote job goes on.
	 */
	Ev::Io<Job> wait(std::string job_id, double timeout = 1800);
};

}

#endif /* !defined(REMOTE_ORCHESTRATOR_HPP) */
