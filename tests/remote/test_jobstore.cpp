#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/coroutine.hpp"
#include"Ev/start.hpp"
#include"Remote/Job.hpp"
#include"Remote/JobStore.hpp"
#include"Sqlite3.hpp"
#include<assert.h>

namespace {

Remote::Job make_job(std::string id, Remote::Status status) {
	auto rv = Remote::Job();
	rv.job_id = std::move(id);
	rv.status = status;
	rv.params.repo_url = "https://github.com/example/hello";
	rv.params.program_id = "TokenkegQfeZyiNwAJbNbGfPvEJPYVp96CrDYVsKjuBD";
	return rv;
}

Ev::Io<int> test(Remote::JobStore& store) {
	co_await store.init();
	/* Idempotent.  */
	co_await store.init();

	auto none = co_await store.get("nope");
	assert(!none);

	co_await store.add(make_job("b-job", Remote::Queued));
	co_await store.add(make_job("a-job", Remote::Queued));
	auto got = co_await store.get("b-job");
	assert(got);
	assert(got->status == Remote::Queued);
	assert(got->params.repo_url == "https://github.com/example/hello");
	assert(!got->has_result);
	assert(got->last_polled_at == 0);

	/* Progress.  */
	auto j = make_job("b-job", Remote::Building);
	j.raw_status = "building";
	j.created_at = "2026-01-02T03:04:05Z";
	j.last_polled_at = 100;
	co_await store.update(j);
	got = co_await store.get("b-job");
	assert(got->status == Remote::Building);
	assert(got->created_at == "2026-01-02T03:04:05Z");
	assert(got->last_polled_at == 100);

	/* Unrecognized statuses survive a round trip.  */
	j.status = Remote::Unknown;
	j.raw_status = "paused";
	co_await store.update(j);
	got = co_await store.get("b-job");
	assert(got->status == Remote::Unknown);
	assert(got->raw_status == "paused");

	/* Local timeouts are not stored.  */
	j.status = Remote::TimedOut;
	j.raw_status = "";
	co_await store.update(j);
	got = co_await store.get("b-job");
	assert(got->raw_status == "paused");

	/* Terminal.  */
	j.status = Remote::Succeeded;
	j.raw_status = "succeeded";
	j.has_result = true;
	j.result.outcome = "verified";
	j.result.local_digest = std::string(64, 'a');
	j.result.onchain_digest = std::string(64, 'a');
	j.last_polled_at = 200;
	co_await store.update(j);
	got = co_await store.get("b-job");
	assert(got->status == Remote::Succeeded);
	assert(got->has_result);
	assert(got->result.outcome == "verified");
	assert(got->result.local_digest == std::string(64, 'a'));

	/* ...and stays so.  */
	auto later = make_job("b-job", Remote::Building);
	later.raw_status = "building";
	later.last_polled_at = 300;
	co_await store.update(later);
	auto failed = make_job("b-job", Remote::Failed);
	failed.raw_status = "failed";
	co_await store.update(failed);
	got = co_await store.get("b-job");
	assert(got->status == Remote::Succeeded);
	assert(got->result.outcome == "verified");
	assert(got->last_polled_at == 200);

	/* Re-adding does not reset.  */
	co_await store.add(make_job("b-job", Remote::Queued));
	got = co_await store.get("b-job");
	assert(got->status == Remote::Succeeded);

	/* Updating an unknown job adds it.  */
	auto c = make_job("c-job", Remote::Verifying);
	c.raw_status = "verifying";
	co_await store.update(c);
	got = co_await store.get("c-job");
	assert(got);
	assert(got->status == Remote::Verifying);

	auto all = co_await store.list();
	assert(all.size() == 3);
	assert(all[0].job_id == "b-job");
	assert(all[1].job_id == "a-job");
	assert(all[2].job_id == "c-job");

	co_return 0;
}

}

int main() {
	auto store = Remote::JobStore(Sqlite3::Db(":memory:"));
	return Ev::start(Ev::lift().then([&]() {
		return test(store);
	}));
}
