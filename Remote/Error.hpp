#ifndef REMOTE_ERROR_HPP
#define REMOTE_ERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Remote {

/* The remote worker could not be reached, or gave
 * an answer that could not be understood.  */
class RemoteError : public Util::BacktraceException<std::runtime_error> {
public:
	RemoteError(std::string const& msg
		   ) : Util::BacktraceException<std::runtime_error>(msg) { }
};

/* A job could not be submitted.  Submissions are
 * never re-sent.  */
class SubmissionError : public RemoteError {
public:
	SubmissionError(std::string const& msg) : RemoteError(msg) { }
};

/* The worker does not know the job.  */
class UnknownJob : public RemoteError {
public:
	std::string const job_id;

	explicit
	UnknownJob(std::string const& job_id_
		  ) : RemoteError("Unknown job: " + job_id_)
		    , job_id(job_id_)
		    { }
};

}

#endif /* !defined(REMOTE_ERROR_HPP) */
