#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include"Ev/coroutine.hpp"
#include"Ev/now.hpp"
#include"Remote/ClientIF.hpp"
#include"Remote/Error.hpp"
#include"Remote/Job.hpp"
#include"Remote/JobStore.hpp"
#include"Remote/Orchestrator.hpp"
#include"Reprove/Mod/Waiter.hpp"
#include"Reprove/log.hpp"
#include"Util/make_unique.hpp"
#include<algorithm>
#include<map>

namespace {

auto constexpr initial_backoff = double(2);
auto constexpr backoff_factor = double(2);
auto constexpr max_backoff = double(30);

}

namespace Remote {

class Orchestrator::Impl {
private:
	S::Bus& bus;
	ClientIF& client;
	JobStore& store;
	Reprove::Mod::Waiter& waiter;

	/* One poll in flight per job.  */
	std::map<std::string, std::unique_ptr<Ev::Semaphore>> locks;
	/* Terminal snapshots seen by this process.  */
	std::map<std::string, Job> terminal;

	Ev::Semaphore& lock(std::string const& job_id) {
		auto& l = locks[job_id];
		if (!l)
			l = Util::make_unique<Ev::Semaphore>(1);
		return *l;
	}

	Ev::Io<Job> poll_core(std::string job_id) {
		auto it = terminal.find(job_id);
		if (it != terminal.end())
			co_return it->second;

		auto stored = co_await store.get(job_id);
		if (stored && is_terminal(stored->status)) {
			terminal[job_id] = *stored;
			co_return *stored;
		}

		auto job = Job();
		if (stored)
			job = *stored;
		else
			job.job_id = job_id;

		job = co_await client.get_job(job);
		job.last_polled_at = Ev::now();
		co_await store.update(job);

		if (job.status == Unknown)
			co_await Reprove::log( bus, Reprove::Warn
					     , "Remote: job %s has unrecognized "
					       "status \"%s\""
					     , job_id.c_str()
					     , job.raw_status.c_str()
					     );
		if (is_terminal(job.status))
			terminal[job_id] = job;
		co_return job;
	}

public:
	Impl( S::Bus& bus_
	    , ClientIF& client_
	    , JobStore& store_
	    , Reprove::Mod::Waiter& waiter_
	    ) : bus(bus_)
	      , client(client_)
	      , store(store_)
	      , waiter(waiter_)
	      { }

	Ev::Io<std::string> submit(JobParams params) {
		auto job_id = co_await client.submit(params);
		co_await Reprove::log( bus, Reprove::Info
				     , "Remote: submitted job %s for %s"
				     , job_id.c_str()
				     , params.program_id.c_str()
				     );
		auto job = Job();
		job.job_id = job_id;
		job.status = Queued;
		job.params = params;
		co_await store.add(job);
		co_return job_id;
	}

	Ev::Io<Job> poll(std::string job_id) {
		return lock(job_id).run(Ev::lift().then([this, job_id]() {
			return poll_core(job_id);
		}));
	}

	Ev::Io<Job> wait(std::string job_id, double timeout) {
		auto start = Ev::now();
		auto delay = initial_backoff;
		auto last = Job();
		last.job_id = job_id;

		for (;;) {
			auto failure = std::string();
			try {
				last = co_await poll(job_id);
			} catch (UnknownJob const&) {
				throw;
			} catch (RemoteError const& e) {
				failure = e.what();
			}
			if (!failure.empty())
				co_await Reprove::log( bus, Reprove::Warn
						     , "Remote: polling %s failed, "
						       "will retry: %s"
						     , job_id.c_str()
						     , failure.c_str()
						     );
			else if (is_terminal(last.status))
				co_return last;
			else
				co_await Reprove::log( bus, Reprove::Info
						     , "Remote: job %s is %s"
						     , job_id.c_str()
						     , status_name(last.status)
						     );

			auto remaining = timeout - (Ev::now() - start);
			if (remaining <= 0) {
				co_await Reprove::log( bus, Reprove::Warn
						     , "Remote: gave up waiting "
						       "for job %s after %g seconds"
						     , job_id.c_str()
						     , timeout
						     );
				last.status = TimedOut;
				co_return last;
			}
			co_await waiter.wait(std::min(delay, remaining));
			delay = std::min(delay * backoff_factor, max_backoff);
		}
	}
};

Orchestrator::Orchestrator( S::Bus& bus
			  , ClientIF& client
			  , JobStore& store
			  , Reprove::Mod::Waiter& waiter
			  ) : pimpl(Util::make_unique<Impl>( bus, client
							   , store, waiter
							   ))
			    { }
Orchestrator::~Orchestrator() =default;

Ev::Io<std::string> Orchestrator::submit(JobParams params) {
	return pimpl->submit(std::move(params));
}
Ev::Io<Job> Orchestrator::poll(std::string job_id) {
	return pimpl->poll(std::move(job_id));
}
Ev::Io<Job> Orchestrator::wait(std::string job_id, double timeout) {
	return pimpl->wait(std::move(job_id), timeout);
}

}
