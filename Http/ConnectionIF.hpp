#ifndef HTTP_CONNECTIONIF_HPP
#define HTTP_CONNECTIONIF_HPP

#include"Jsmn/Object.hpp"
#include"Util/BacktraceException.hpp"
#include<memory>
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Json { class Out; }

namespace Http {

/** struct Http::Response
 *
 * @brief the HTTP status code and the JSON body
 * of a response.
 *
 * @desc `body` is a null object if the response
 * body was empty or not JSON; `raw` then holds
 * whatever the server sent.
 */
struct Response {
	long status;
	Jsmn::Object body;
	std::string raw;
};

/** class Http::ConnectionIF
 *
 * @brief interface to an object that provides
 * access to a JSON-over-HTTP endpoint.
 */
class ConnectionIF {
public:
	virtual ~ConnectionIF() { }

	/* Send an API request.
	 * Non-2xx statuses are *not* errors at this
	 * level; they are reported in the response.
	 */
	virtual
	Ev::Io<Http::Response>
	api( std::string path /* e.g. "/jobs" */
	   /* nullptr if GET, or the request body if POST.  */
	   , std::unique_ptr<Json::Out> params
	   ) =0;
};

/** Http::ApiError
 *
 * @brief thrown when the request could not be
 * delivered or no response was received.
 */
class ApiError : public Util::BacktraceException<std::runtime_error> {
public:
	ApiError(std::string const& e
		) : Util::BacktraceException<std::runtime_error>(e) { }
};

}

#endif /* !defined(HTTP_CONNECTIONIF_HPP) */
