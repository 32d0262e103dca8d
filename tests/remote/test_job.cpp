#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Remote/Job.hpp"
#include"Remote/Status.hpp"
#include<assert.h>

namespace {

Jsmn::Object parse(std::string const& s) {
	auto parser = Jsmn::Parser();
	auto rv = parser.feed(s);
	assert(rv.size() == 1);
	return rv[0];
}

bool malformed(std::string const& s) {
	auto job = Remote::Job();
	try {
		Remote::job_from_response(job, parse(s));
	} catch (Jsmn::TypeError const&) {
		return true;
	}
	return false;
}

}

int main() {
	/* Status strings.  */
	assert(Remote::parse_status("queued") == Remote::Queued);
	assert(Remote::parse_status("building") == Remote::Building);
	assert(Remote::parse_status("verifying") == Remote::Verifying);
	assert(Remote::parse_status("succeeded") == Remote::Succeeded);
	assert(Remote::parse_status("failed") == Remote::Failed);
	assert(Remote::parse_status("timed_out") == Remote::Unknown);
	assert(Remote::parse_status("Queued") == Remote::Unknown);
	assert(Remote::parse_status("paused") == Remote::Unknown);
	assert(Remote::parse_status("") == Remote::Unknown);
	for (auto s : { Remote::Queued, Remote::Building, Remote::Verifying
		      , Remote::Succeeded, Remote::Failed
		      })
		assert(Remote::parse_status(Remote::status_name(s)) == s);
	assert(std::string(Remote::status_name(Remote::TimedOut)) == "timed_out");

	assert(!Remote::is_terminal(Remote::Queued));
	assert(!Remote::is_terminal(Remote::Verifying));
	assert(!Remote::is_terminal(Remote::TimedOut));
	assert(!Remote::is_terminal(Remote::Unknown));
	assert(Remote::is_terminal(Remote::Succeeded));
	assert(Remote::is_terminal(Remote::Failed));

	/* Submission body omits empty optionals.  */
	auto p = Remote::JobParams();
	p.repo_url = "https://github.com/example/hello";
	p.program_id = "TokenkegQfeZyiNwAJbNbGfPvEJPYVp96CrDYVsKjuBD";
	p.library_name = "hello";
	auto js = parse(Remote::params_to_json(p).output());
	assert(std::string(js["repo_url"]) == p.repo_url);
	assert(std::string(js["program_id"]) == p.program_id);
	assert(std::string(js["library_name"]) == "hello");
	assert(!js.has("commit_hash"));
	assert(!js.has("base_image"));
	auto p2 = Remote::params_from_json(js);
	assert(p2.repo_url == p.repo_url);
	assert(p2.library_name == "hello");
	assert(p2.commit_hash == "");

	/* Worker responses.  */
	auto job = Remote::Job();
	job.job_id = "j-1";
	Remote::job_from_response(job, parse(R"({"status":"building","created_at":"2026-01-02T03:04:05Z"})"));
	assert(job.status == Remote::Building);
	assert(job.raw_status == "building");
	assert(job.created_at == "2026-01-02T03:04:05Z");
	assert(!job.has_result);
	assert(job.job_id == "j-1");

	Remote::job_from_response(job, parse(R"({"status":"succeeded","result":)"
		R"({"outcome":"mismatch","local_digest":"aa","onchain_digest":"bb"}})"));
	assert(job.status == Remote::Succeeded);
	assert(job.has_result);
	assert(job.result.outcome == "mismatch");
	assert(job.result.local_digest == "aa");
	assert(job.result.onchain_digest == "bb");
	/* Kept from before.  */
	assert(job.created_at == "2026-01-02T03:04:05Z");

	job = Remote::Job();
	Remote::job_from_response(job, parse(R"({"status":"paused","result":null})"));
	assert(job.status == Remote::Unknown);
	assert(job.raw_status == "paused");
	assert(!job.has_result);

	assert(malformed("[]"));
	assert(malformed("{}"));
	assert(malformed(R"({"status":3})"));
	assert(malformed(R"({"status":"failed","result":"oops"})"));

	/* Rendering.  */
	job.job_id = "j-2";
	auto out = parse(Remote::job_to_json(job).output());
	assert(std::string(out["job_id"]) == "j-2");
	assert(std::string(out["status"]) == "unknown");
	assert(std::string(out["remote_status"]) == "paused");
	assert(!out.has("result"));
	assert(!out.has("last_polled_at"));
	assert(out["params"].is_object());

	job.status = Remote::Failed;
	job.has_result = true;
	job.result.outcome = "error";
	job.result.message = "build failed";
	job.last_polled_at = 12.5;
	out = parse(Remote::job_to_json(job).output());
	assert(std::string(out["status"]) == "failed");
	assert(!out.has("remote_status"));
	assert(std::string(out["result"]["outcome"]) == "error");
	assert(std::string(out["result"]["message"]) == "build failed");
	assert(!out["result"].has("local_digest"));
	assert(double(out["last_polled_at"]) == 12.5);

	return 0;
}
