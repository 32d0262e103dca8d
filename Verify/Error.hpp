#ifndef VERIFY_ERROR_HPP
#define VERIFY_ERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Verify {

/* An attestation was requested for a result that
 * is not `Verified`.  */
class AttestationRefused : public Util::BacktraceException<std::runtime_error> {
public:
	AttestationRefused(std::string const& msg
			  ) : Util::BacktraceException<std::runtime_error>(msg) { }
};

/* Writing the attestation to the chain failed.  */
class AttestationError : public Util::BacktraceException<std::runtime_error> {
public:
	AttestationError(std::string const& msg
			) : Util::BacktraceException<std::runtime_error>(msg) { }
};

}

#endif /* !defined(VERIFY_ERROR_HPP) */
