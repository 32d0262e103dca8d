#include"Ev/Io.hpp"
#include"Ev/coroutine.hpp"
#include"Ev/now.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include"Remote/Job.hpp"
#include"Remote/JobStore.hpp"
#include"Sqlite3.hpp"

namespace {

Jsmn::Object parse_json(std::string const& s) {
	if (s.empty())
		return Jsmn::Object();
	try {
		auto parser = Jsmn::Parser();
		auto js = parser.feed(s + "\n");
		if (js.empty())
			return Jsmn::Object();
		return js[0];
	} catch (Jsmn::ParseError const&) {
		return Jsmn::Object();
	}
}

Remote::Job job_from_row(Sqlite3::Row& r) {
	auto rv = Remote::Job();
	rv.job_id = r.get<std::string>(0);
	rv.raw_status = r.get<std::string>(1);
	rv.status = Remote::parse_status(rv.raw_status);
	rv.params = Remote::params_from_json(parse_json(r.get<std::string>(2)));
	auto result = parse_json(r.get<std::string>(3));
	if (result.is_object()) {
		rv.has_result = true;
		rv.result = Remote::result_from_json(result);
	}
	rv.created_at = r.get<std::string>(4);
	rv.last_polled_at = r.get<double>(5);
	return rv;
}

std::string result_text(Remote::Job const& job) {
	if (!job.has_result)
		return "";
	return Remote::result_to_json(job.result).output();
}

/* The status to store: the worker's own string,
 * so that unrecognized ones survive.  */
std::string status_text(Remote::Job const& job) {
	if (!job.raw_status.empty())
		return job.raw_status;
	return Remote::status_name(job.status);
}

auto const select_columns = std::string(R"QRY(
	SELECT job_id, status, params, result, created_at, last_polled_at
	  FROM "RemoteJobs"
)QRY");

}

namespace Remote {

Ev::Io<void> JobStore::init() {
	auto tx = co_await db.transact();
	tx.query_execute(R"QRY(
	CREATE TABLE IF NOT EXISTS "RemoteJobs"
		( job_id TEXT PRIMARY KEY
		, status TEXT NOT NULL
		, params TEXT NOT NULL
		, result TEXT NOT NULL
		, created_at TEXT NOT NULL
		, submitted_at REAL NOT NULL
		, last_polled_at REAL NOT NULL
		);
	)QRY");
	tx.commit();
	co_return;
}

Ev::Io<void> JobStore::add(Job job) {
	auto tx = co_await db.transact();
	tx.query(R"QRY(
	INSERT OR IGNORE INTO "RemoteJobs"
	VALUES( :job_id, :status, :params, :result, :created_at
	      , :submitted_at, :last_polled_at
	      );
	)QRY")
		.bind(":job_id", job.job_id)
		.bind(":status", status_text(job))
		.bind(":params", params_to_json(job.params).output())
		.bind(":result", result_text(job))
		.bind(":created_at", job.created_at)
		.bind(":submitted_at", Ev::now())
		.bind(":last_polled_at", job.last_polled_at)
		.execute();
	tx.commit();
	co_return;
}

Ev::Io<void> JobStore::update(Job job) {
	if (job.status == TimedOut)
		co_return;

	auto tx = co_await db.transact();
	tx.query(R"QRY(
	INSERT OR IGNORE INTO "RemoteJobs"
	VALUES( :job_id, :status, :params, :result, :created_at
	      , :submitted_at, :last_polled_at
	      );
	)QRY")
		.bind(":job_id", job.job_id)
		.bind(":status", status_text(job))
		.bind(":params", params_to_json(job.params).output())
		.bind(":result", result_text(job))
		.bind(":created_at", job.created_at)
		.bind(":submitted_at", Ev::now())
		.bind(":last_polled_at", job.last_polled_at)
		.execute();
	tx.query(R"QRY(
	UPDATE "RemoteJobs"
	   SET status = :status
	     , result = :result
	     , created_at = :created_at
	     , last_polled_at = :last_polled_at
	 WHERE job_id = :job_id
	   AND status NOT IN ('succeeded', 'failed')
	     ;
	)QRY")
		.bind(":job_id", job.job_id)
		.bind(":status", status_text(job))
		.bind(":result", result_text(job))
		.bind(":created_at", job.created_at)
		.bind(":last_polled_at", job.last_polled_at)
		.execute();
	tx.commit();
	co_return;
}

Ev::Io<std::shared_ptr<Job>> JobStore::get(std::string const& job_id) {
	auto id = job_id;
	auto tx = co_await db.transact();
	auto rv = std::shared_ptr<Job>();
	auto fetch = tx.query(select_columns + R"QRY(
	 WHERE job_id = :job_id;
	)QRY")
		.bind(":job_id", id)
		.execute();
	for (auto& r : fetch)
		rv = std::make_shared<Job>(job_from_row(r));
	tx.commit();
	co_return rv;
}

Ev::Io<std::vector<Job>> JobStore::list() {
	auto tx = co_await db.transact();
	auto rv = std::vector<Job>();
	auto fetch = tx.query(select_columns + R"QRY(
	 ORDER BY submitted_at, job_id;
	)QRY").execute();
	for (auto& r : fetch)
		rv.push_back(job_from_row(r));
	tx.commit();
	co_return rv;
}

}
