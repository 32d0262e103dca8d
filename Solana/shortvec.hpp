#ifndef SOLANA_SHORTVEC_HPP
#define SOLANA_SHORTVEC_HPP

#include<cstdint>
#include<iostream>

namespace Solana { namespace Detail { class ShortVec; }}
namespace Solana { namespace Detail { class ShortVecConst; }}

namespace Solana {

/** Solana::shortvec
 *
 * @brief wraps a length so that it is serialized as
 * the compact-u16 prefix of transaction arrays.
 *
 * @desc Seven bits per byte, least significant
 * first, with the high bit set on every byte but
 * the last; at most three bytes.
 *
 *     os << Solana::shortvec(keys.size());
 *
 * Writing a value above 0xFFFF throws
 * `std::length_error`; reading a malformed prefix
 * sets the failbit.
 */
Detail::ShortVec shortvec(std::uint16_t& v);
Detail::ShortVecConst shortvec(std::size_t v);

}

std::ostream& operator<<(std::ostream&, Solana::Detail::ShortVecConst);
std::istream& operator>>(std::istream&, Solana::Detail::ShortVec);

namespace Solana { namespace Detail {

class ShortVec {
private:
	std::uint16_t& v;

	friend
	std::istream& ::operator>>(std::istream&, Solana::Detail::ShortVec);

public:
	ShortVec(std::uint16_t& v_) : v(v_) { }
};

class ShortVecConst {
private:
	std::size_t v;

	friend
	std::ostream& ::operator<<(std::ostream&, Solana::Detail::ShortVecConst);

public:
	ShortVecConst(std::size_t v_) : v(v_) { }
};

}}

#endif /* !defined(SOLANA_SHORTVEC_HPP) */
