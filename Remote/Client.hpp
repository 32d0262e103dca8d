#ifndef REMOTE_CLIENT_HPP
#define REMOTE_CLIENT_HPP

#include"Remote/ClientIF.hpp"

namespace Http { class ConnectionIF; }

namespace Remote {

/** class Remote::Client
 *
 * @brief talks to the worker with `POST /jobs` and
 * `GET /jobs/{id}` over an HTTP connection.
 */
class Client : public ClientIF {
private:
	Http::ConnectionIF& conn;

public:
	Client() =delete;
	explicit
	Client(Http::ConnectionIF& conn_) : conn(conn_) { }

	Ev::Io<std::string> submit(JobParams const& params) override;
	Ev::Io<Job> get_job(Job job) override;

	/* Job ids are used in URL paths, so only
	 * alphanumerics, `-`, `_` and `.` are allowed.  */
	static
	bool valid_job_id(std::string const& job_id);
};

}

#endif /* !defined(REMOTE_CLIENT_HPP) */
