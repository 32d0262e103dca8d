#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/coroutine.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Remote/ClientIF.hpp"
#include"Remote/Error.hpp"
#include"Remote/Job.hpp"
#include"Remote/JobStore.hpp"
#include"Remote/Orchestrator.hpp"
#include"Reprove/Mod/Waiter.hpp"
#include"Reprove/Shutdown.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include<assert.h>
#include<deque>
#include<map>

namespace {

/* A worker that reports scripted statuses, one per
 * poll, repeating the last.  */
class FakeClient : public Remote::ClientIF {
public:
	std::size_t submits = 0;
	std::size_t polls = 0;
	std::size_t in_flight = 0;
	std::size_t max_in_flight = 0;
	bool fail_submit = false;
	std::map<std::string, std::deque<std::string>> statuses;

	Ev::Io<std::string> submit(Remote::JobParams const&) override {
		++submits;
		if (fail_submit)
			return Ev::lift().then([]() -> Ev::Io<std::string> {
				throw Remote::SubmissionError("rejected");
			});
		auto id = "job-" + std::to_string(submits);
		statuses[id] = {"queued"};
		return Ev::lift(id);
	}

	Ev::Io<Remote::Job> get_job(Remote::Job job) override {
		++polls;
		++in_flight;
		max_in_flight = std::max(max_in_flight, in_flight);
		return Ev::yield().then([this, job]() {
			--in_flight;
			auto it = statuses.find(job.job_id);
			if (it == statuses.end())
				throw Remote::UnknownJob(job.job_id);
			auto& q = it->second;
			auto status = q.front();
			if (q.size() > 1)
				q.pop_front();
			if (status == "!")
				throw Remote::RemoteError("worker unreachable");
			auto rv = job;
			rv.raw_status = status;
			rv.status = Remote::parse_status(status);
			if (rv.status == Remote::Succeeded) {
				rv.has_result = true;
				rv.result.outcome = "verified";
				rv.result.local_digest = std::string(64, 'c');
				rv.result.onchain_digest = std::string(64, 'c');
			}
			return Ev::lift(rv);
		});
	}
};

Ev::Io<void> wait_interrupted( Remote::Orchestrator& orch
			     , std::string id
			     , bool& interrupted
			     ) {
	try {
		co_await orch.wait(id, 60);
	} catch (Reprove::Shutdown const&) {
		interrupted = true;
	}
}

Ev::Io<int> test( S::Bus& bus
		, Reprove::Mod::Waiter& waiter
		, Remote::Orchestrator& orch
		, FakeClient& client
		, Remote::JobStore& store
		) {
	/* Submission is recorded as queued.  */
	auto params = Remote::JobParams();
	params.repo_url = "https://github.com/example/hello";
	params.program_id = "TokenkegQfeZyiNwAJbNbGfPvEJPYVp96CrDYVsKjuBD";
	auto id = co_await orch.submit(params);
	assert(id == "job-1");
	assert(client.submits == 1);
	auto stored = co_await store.get(id);
	assert(stored);
	assert(stored->status == Remote::Queued);
	assert(stored->params.program_id == params.program_id);

	/* Failed submissions are not retried.  */
	client.fail_submit = true;
	auto flag = false;
	try {
		co_await orch.submit(params);
	} catch (Remote::SubmissionError const&) {
		flag = true;
	}
	assert(flag);
	assert(client.submits == 2);
	client.fail_submit = false;

	/* Polling.  */
	client.statuses[id] = {"queued", "succeeded"};
	auto job = co_await orch.poll(id);
	assert(job.status == Remote::Queued);
	assert(job.last_polled_at > 0);
	assert(job.params.repo_url == params.repo_url);

	/* Wait follows the job to the end.  */
	job = co_await orch.wait(id, 60);
	assert(job.status == Remote::Succeeded);
	assert(job.has_result);
	assert(job.result.outcome == "verified");
	stored = co_await store.get(id);
	assert(stored->status == Remote::Succeeded);

	/* Terminal snapshots are not polled again.  */
	auto polls = client.polls;
	job = co_await orch.poll(id);
	assert(job.status == Remote::Succeeded);
	job = co_await orch.wait(id, 60);
	assert(job.status == Remote::Succeeded);
	assert(client.polls == polls);

	/* Unknown to the worker.  */
	flag = false;
	try {
		co_await orch.poll("job-999");
	} catch (Remote::UnknownJob const& e) {
		flag = true;
		assert(e.job_id == "job-999");
	}
	assert(flag);
	flag = false;
	try {
		co_await orch.wait("job-999", 60);
	} catch (Remote::UnknownJob const&) {
		flag = true;
	}
	assert(flag);

	/* Statuses this version does not know.  */
	client.statuses["job-7"] = {"paused"};
	job = co_await orch.poll("job-7");
	assert(job.status == Remote::Unknown);
	assert(job.raw_status == "paused");
	stored = co_await store.get("job-7");
	assert(stored && stored->raw_status == "paused");

	/* Giving up.  */
	client.statuses["job-8"] = {"building"};
	job = co_await orch.wait("job-8", 0.2);
	assert(job.status == Remote::TimedOut);
	assert(job.job_id == "job-8");
	stored = co_await store.get("job-8");
	assert(stored->status == Remote::Building);

	/* Transient poll failures are retried.  */
	client.statuses["job-9"] = {"!", "failed"};
	job = co_await orch.wait("job-9", 60);
	assert(job.status == Remote::Failed);

	/* Concurrent polls of one job are serialized.  */
	client.statuses["job-10"] = {"building"};
	client.max_in_flight = 0;
	co_await Ev::concurrent(orch.poll("job-10").then([](Remote::Job) {
		return Ev::lift();
	}));
	co_await Ev::concurrent(orch.poll("job-10").then([](Remote::Job) {
		return Ev::lift();
	}));
	job = co_await orch.poll("job-10");
	assert(job.status == Remote::Building);
	assert(client.max_in_flight == 1);

	/* An interrupt stops local polling during the
	 * backoff sleep; the worker is not contacted again
	 * and the job stays as last seen.  */
	client.statuses["job-11"] = {"building"};
	auto interrupted = false;
	auto before = client.polls;
	co_await Ev::concurrent(Ev::lift().then([&]() {
		return wait_interrupted(orch, "job-11", interrupted);
	}));
	while (client.polls == before || waiter.pending() == 0)
		co_await Ev::yield();
	assert(client.polls == before + 1);
	co_await bus.raise(Reprove::Shutdown());
	while (!interrupted)
		co_await Ev::yield();
	assert(waiter.pending() == 0);
	for (auto i = 0; i < 20; ++i)
		co_await Ev::yield();
	assert(client.polls == before + 1);
	stored = co_await store.get("job-11");
	assert(stored && stored->status == Remote::Building);

	co_return 0;
}

}

int main() {
	auto bus = S::Bus();
	auto waiter = Reprove::Mod::Waiter(bus);
	auto client = FakeClient();
	auto store = Remote::JobStore(Sqlite3::Db(":memory:"));
	auto orch = Remote::Orchestrator(bus, client, store, waiter);
	return Ev::start(Ev::lift().then([&]() {
		return store.init();
	}).then([&]() {
		return test(bus, waiter, orch, client, store);
	}));
}
