#include"Jsmn/Object.hpp"
#include"Remote/Job.hpp"

namespace {

std::string optional_string(Jsmn::Object const& js, char const* key) {
	if (!js.has(key))
		return "";
	auto v = js[key];
	if (v.is_null())
		return "";
	if (!v.is_string())
		throw Jsmn::TypeError();
	return std::string(v);
}

template<typename Obj>
void optional_field(Obj& obj, char const* key, std::string const& v) {
	if (!v.empty())
		obj.field(key, v);
}

}

namespace Remote {

Json::Out params_to_json(JobParams const& p) {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	obj.field("repo_url", p.repo_url)
	   .field("program_id", p.program_id)
	   ;
	optional_field(obj, "commit_hash", p.commit_hash);
	optional_field(obj, "library_name", p.library_name);
	optional_field(obj, "base_image", p.base_image);
	obj.end_object();
	return rv;
}

JobParams params_from_json(Jsmn::Object const& js) {
	auto rv = JobParams();
	if (!js.is_object())
		return rv;
	rv.repo_url = optional_string(js, "repo_url");
	rv.program_id = optional_string(js, "program_id");
	rv.commit_hash = optional_string(js, "commit_hash");
	rv.library_name = optional_string(js, "library_name");
	rv.base_image = optional_string(js, "base_image");
	return rv;
}

Json::Out result_to_json(JobResult const& r) {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	obj.field("outcome", r.outcome);
	optional_field(obj, "local_digest", r.local_digest);
	optional_field(obj, "onchain_digest", r.onchain_digest);
	optional_field(obj, "message", r.message);
	obj.end_object();
	return rv;
}

JobResult result_from_json(Jsmn::Object const& js) {
	if (!js.is_object())
		throw Jsmn::TypeError();
	auto rv = JobResult();
	rv.outcome = optional_string(js, "outcome");
	rv.local_digest = optional_string(js, "local_digest");
	rv.onchain_digest = optional_string(js, "onchain_digest");
	rv.message = optional_string(js, "message");
	return rv;
}

Json::Out job_to_json(Job const& job) {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	obj.field("job_id", job.job_id)
	   .field("status", std::string(status_name(job.status)))
	   ;
	if (job.status == Unknown && !job.raw_status.empty())
		obj.field("remote_status", job.raw_status);
	optional_field(obj, "created_at", job.created_at);
	if (job.last_polled_at != 0)
		obj.field("last_polled_at", job.last_polled_at);
	obj.field("params", params_to_json(job.params));
	if (job.has_result)
		obj.field("result", result_to_json(job.result));
	obj.end_object();
	return rv;
}

void job_from_response(Job& job, Jsmn::Object const& js) {
	if (!js.is_object() || !js["status"].is_string())
		throw Jsmn::TypeError();
	job.raw_status = std::string(js["status"]);
	job.status = parse_status(job.raw_status);
	auto created_at = optional_string(js, "created_at");
	if (!created_at.empty())
		job.created_at = created_at;
	if (js.has("result") && !js["result"].is_null()) {
		job.has_result = true;
		job.result = result_from_json(js["result"]);
	}
}

}
