#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Http/Connection.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Util/make_unique.hpp"
#include<assert.h>
#include<curl/curl.h>
#include<vector>

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

namespace {

/* Class to create a CURL easy handle, then execute
 * the given request.  */
class EasyHandle {
private:
	std::string raw;
	std::vector<char> errbuf;
	curl_slist* headers;
	CURL* curl;

	EasyHandle() {
		errbuf.resize(CURL_ERROR_SIZE);
		for (auto& b : errbuf)
			b = 0;

		headers = NULL;
		headers = curl_slist_append(headers
					   , "Content-Type: application/json"
					   );
		headers = curl_slist_append(headers
					   , "Accept: application/json"
					   );

		curl = curl_easy_init();
		if (!curl)
			throw Http::ApiError("curl_easy_init failed");
		curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
		curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, &errbuf[0]);
	}
	~EasyHandle() {
		if (curl)
			curl_easy_cleanup(curl);
		curl_slist_free_all(headers);
	}

public:
	static
	Http::Response run( std::string const& url
			  , long timeout
			  , std::unique_ptr<Json::Out> parms
			  ) {
		EasyHandle self;
		return self.run_core(url, timeout, std::move(parms));
	}

private:
	static
	size_t write_cb_s(char* ptr, size_t size, size_t nmemb, void* vself) {
		assert(size == 1);
		return ((EasyHandle*)vself)->write_cb(ptr, nmemb);
	}
	size_t write_cb(char* ptr, size_t size) {
		raw.append(ptr, size);
		return size;
	}

	Http::Response run_core( std::string const& url
			       , long timeout
			       , std::unique_ptr<Json::Out> parms
			       ) {
		curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_cb_s);
		curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);

		curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
		curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
		curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
		curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);

		/* Needs to survive until after curl_easy_perform.  */
		auto postfields = std::string();
		if (parms) {
			postfields = parms->output();
			curl_easy_setopt( curl, CURLOPT_POSTFIELDS
					, postfields.c_str()
					);
			curl_easy_setopt( curl, CURLOPT_POSTFIELDSIZE_LARGE
					, (curl_off_t) postfields.size()
					);
		}

		curl_easy_setopt( curl, CURLOPT_USERAGENT
				, "reprove/" PACKAGE_VERSION
				);
		curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
		curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 50L);
		curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

		auto ret = curl_easy_perform(curl);
		if (ret != CURLE_OK) {
			auto msg = std::string(curl_easy_strerror(ret))
				 + ": "
				 + std::string(&errbuf[0])
				 ;
			throw Http::ApiError(url + ": " + msg);
		}

		auto rv = Http::Response();
		rv.status = 0;
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &rv.status);
		rv.raw = std::move(raw);

		/* A body that is not JSON is left as null, the
		 * caller decides based on the status.  */
		try {
			auto parser = Jsmn::Parser();
			/* Terminate a trailing bare number.  */
			auto results = parser.feed(rv.raw + "\n");
			if (!results.empty())
				rv.body = std::move(results[0]);
		} catch (Jsmn::ParseError const&) {
			rv.body = Jsmn::Object();
		}
		return rv;
	}
};

}

namespace Http {

class Connection::Impl {
private:
	Ev::ThreadPool& threadpool;
	std::string api_base;
	long timeout;

public:
	Impl() =delete;
	Impl(Impl const&) =delete;
	Impl(Impl&&) =delete;

	Impl( Ev::ThreadPool& threadpool_
	    , std::string api_base_
	    , long timeout_
	    ) : threadpool(threadpool_)
	      , api_base(std::move(api_base_))
	      , timeout(timeout_)
	      { }

	Ev::Io<Http::Response>
	api(std::string path, std::unique_ptr<Json::Out> params) {
		auto pparams = std::make_shared<std::unique_ptr<Json::Out>>(
			std::move(params)
		);
		auto url = api_base + path;
		auto t = timeout;
		return threadpool.background<Http::Response>([ url
							     , t
							     , pparams
							     ]() {
			return EasyHandle::run( url
					      , t
					      , std::move(*pparams)
					      );
		});
	}
};

Connection::~Connection() =default;
Connection::Connection(Connection&&) =default;

Connection::Connection( Ev::ThreadPool& threadpool
		      , std::string api_base
		      , long timeout
		      ) : pimpl(Util::make_unique<Impl>( threadpool
						       , std::move(api_base)
						       , timeout
						       ))
			{ }

Ev::Io<Http::Response>
Connection::api(std::string path, std::unique_ptr<Json::Out> params) {
	return pimpl->api(std::move(path), std::move(params));
}

}
