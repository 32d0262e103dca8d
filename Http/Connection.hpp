#ifndef HTTP_CONNECTION_HPP
#define HTTP_CONNECTION_HPP

#include"Http/ConnectionIF.hpp"
#include<memory>
#include<string>

namespace Ev { class ThreadPool; }

namespace Http {

/** class Http::Connection
 *
 * @brief libcurl-backed connection to a single
 * endpoint.
 *
 * @desc Each request runs a blocking curl easy
 * handle on the given thread pool, and resumes on
 * the main loop with the response.
 */
class Connection : public ConnectionIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Connection() =delete;
	Connection(Connection const&) =delete;
	Connection(Connection&&);
	~Connection();

	explicit
	Connection( Ev::ThreadPool& threadpool
		  /* Base address of the endpoint.  */
		  , std::string api_base
		  /* Per-request timeout, in seconds.  */
		  , long timeout = 60
		  );

	Ev::Io<Http::Response>
	api(std::string path, std::unique_ptr<Json::Out> params) override;
};

}

#endif /* !defined(HTTP_CONNECTION_HPP) */
