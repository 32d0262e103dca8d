#include"Ev/Io.hpp"
#include"Http/ConnectionIF.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Remote/Client.hpp"
#include"Remote/Error.hpp"
#include"Remote/Job.hpp"
#include"Util/make_unique.hpp"

namespace {

bool is_success(long status) {
	return status >= 200 && status < 300;
}

std::string describe(Http::Response const& resp) {
	auto rv = "HTTP status " + std::to_string(resp.status);
	if (resp.body.is_object() && resp.body["error"].is_string())
		rv += ": " + std::string(resp.body["error"]);
	return rv;
}

}

namespace Remote {

bool Client::valid_job_id(std::string const& job_id) {
	if (job_id.empty() || job_id.size() > 128)
		return false;
	for (auto c : job_id) {
		auto ok = (c >= 'a' && c <= 'z')
		       || (c >= 'A' && c <= 'Z')
		       || (c >= '0' && c <= '9')
		       || c == '-' || c == '_' || c == '.'
			;
		if (!ok)
			return false;
	}
	return job_id != "." && job_id != "..";
}

Ev::Io<std::string> Client::submit(JobParams const& params) {
	auto body = Util::make_unique<Json::Out>(params_to_json(params));
	return conn.api("/jobs", std::move(body))
	     .catching<Http::ApiError>([](Http::ApiError const& e) {
		throw SubmissionError(std::string("Cannot submit job: ") + e.what());
		return Ev::lift(Http::Response());
	}).then([](Http::Response resp) {
		if (!is_success(resp.status))
			throw SubmissionError( "Job rejected: "
					     + describe(resp)
					     );
		auto const& body = resp.body;
		if ( !body.is_object() || !body["job_id"].is_string()
		  || !valid_job_id(std::string(body["job_id"]))
		   )
			throw SubmissionError( "Job submitted but no usable "
					       "job id returned: "
					     + resp.raw
					     );
		return Ev::lift(std::string(body["job_id"]));
	});
}

Ev::Io<Job> Client::get_job(Job job) {
	if (!valid_job_id(job.job_id))
		return Ev::lift().then([job]() -> Ev::Io<Job> {
			throw UnknownJob(job.job_id);
		});
	auto job_id = job.job_id;
	return conn.api("/jobs/" + job_id, nullptr)
	     .catching<Http::ApiError>([job_id](Http::ApiError const& e) {
		throw RemoteError( "Cannot poll job " + job_id + ": "
				 + e.what()
				 );
		return Ev::lift(Http::Response());
	}).then([job](Http::Response resp) {
		if (resp.status == 404)
			throw UnknownJob(job.job_id);
		if (!is_success(resp.status))
			throw RemoteError( "Cannot poll job " + job.job_id
					 + ": " + describe(resp)
					 );
		auto rv = job;
		try {
			job_from_response(rv, resp.body);
		} catch (Jsmn::TypeError const&) {
			throw RemoteError( "Malformed status of job "
					 + job.job_id + ": " + resp.raw
					 );
		}
		return Ev::lift(std::move(rv));
	});
}

}
