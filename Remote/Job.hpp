#ifndef REMOTE_JOB_HPP
#define REMOTE_JOB_HPP

#include"Json/Out.hpp"
#include"Remote/Status.hpp"
#include<memory>
#include<string>

namespace Jsmn { class Object; }

namespace Remote {

/** struct Remote::JobParams
 *
 * @brief what a job is asked to verify.  Empty
 * strings are omitted from the request.
 */
struct JobParams {
	std::string repo_url;
	std::string program_id;
	std::string commit_hash;
	std::string library_name;
	std::string base_image;
};

/** struct Remote::JobResult
 *
 * @brief the verification outcome a worker reports
 * with a terminal status: `verified`, `mismatch` or
 * `error`.
 */
struct JobResult {
	std::string outcome;
	std::string local_digest;
	std::string onchain_digest;
	std::string message;
};

/** struct Remote::Job
 *
 * @brief a snapshot of a remote job.
 *
 * @desc `raw_status` is the status string as the
 * worker sent it, kept so that `Unknown` statuses
 * can still be shown.
 * `last_polled_at` is 0 if the job was never polled.
 */
struct Job {
	std::string job_id;
	Status status = Queued;
	std::string raw_status;
	JobParams params;
	bool has_result = false;
	JobResult result;
	std::string created_at;
	double last_polled_at = 0;
};

/* Request body of a submission.  */
Json::Out params_to_json(JobParams const& p);
JobParams params_from_json(Jsmn::Object const& js);

Json::Out result_to_json(JobResult const& r);
JobResult result_from_json(Jsmn::Object const& js);

Json::Out job_to_json(Job const& job);

/** Remote::job_from_response
 *
 * @brief fill in the worker-reported fields of a
 * job from the `GET /jobs/{id}` response.
 *
 * @desc Throws `Jsmn::TypeError` if the response is
 * not an object with a string `status`.
 */
void job_from_response(Job& job, Jsmn::Object const& js);

}

#endif /* !defined(REMOTE_JOB_HPP) */
