#ifndef VERIFY_RESULT_HPP
#define VERIFY_RESULT_HPP

#include"Sha256/Hash.hpp"
#include<string>

namespace Verify {

/** class Verify::Result
 *
 * @brief the outcome of comparing a locally built
 * digest with the deployed one.
 *
 * @desc `Verified` carries the common digest.
 * `Mismatch` carries the local digest as
 * `expected` and the deployed digest as `actual`.
 * `Error` is made only when an operational failure
 * prevented the comparison, and carries the kind of
 * failure and a message.
 */
class Result {
public:
	enum Kind {
		Verified,
		Mismatch,
		Error
	};

private:
	Kind kind_;
	Sha256::Hash expected_;
	Sha256::Hash actual_;
	std::string error_kind_;
	std::string message_;

	Result( Kind k
	      , Sha256::Hash e
	      , Sha256::Hash a
	      , std::string ek
	      , std::string m
	      ) : kind_(k)
		, expected_(std::move(e))
		, actual_(std::move(a))
		, error_kind_(std::move(ek))
		, message_(std::move(m))
		{ }

public:
	Result() =delete;

	static
	Result verified(Sha256::Hash const& digest) {
		return Result(Verified, digest, digest, "", "");
	}
	static
	Result mismatch( Sha256::Hash const& expected
		       , Sha256::Hash const& actual
		       ) {
		return Result(Mismatch, expected, actual, "", "");
	}
	static
	Result error(std::string kind, std::string message) {
		return Result( Error, Sha256::Hash(), Sha256::Hash()
			     , std::move(kind), std::move(message)
			     );
	}

	Kind kind() const { return kind_; }
	bool is_verified() const { return kind_ == Verified; }

	Sha256::Hash const& digest() const { return expected_; }
	Sha256::Hash const& expected() const { return expected_; }
	Sha256::Hash const& actual() const { return actual_; }
	std::string const& error_kind() const { return error_kind_; }
	std::string const& message() const { return message_; }
};

char const* result_kind_name(Result::Kind);

}

#endif /* !defined(VERIFY_RESULT_HPP) */
