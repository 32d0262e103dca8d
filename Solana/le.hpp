#ifndef SOLANA_LE_HPP
#define SOLANA_LE_HPP

#include<cstdint>
#include<iostream>

namespace Solana { namespace Detail { class Le32; }}
namespace Solana { namespace Detail { class Le32Const; }}
namespace Solana { namespace Detail { class Le64; }}
namespace Solana { namespace Detail { class Le64Const; }}

namespace Solana {

/** Solana::le
 *
 * @brief wraps a uint32, uint64 or int64 so it is
 * encoded in the little-endian form used by account
 * layouts and instruction data.
 *
 * @desc intended use is:
 *
 *     os << Solana::le(expr);
 *     is >> Solana::le(var);
 *
 * A short read sets the failbit of the stream.
 */
Detail::Le32 le(std::uint32_t& v);
Detail::Le32Const le(std::uint32_t const& v);
Detail::Le64 le(std::uint64_t& v);
Detail::Le64Const le(std::uint64_t const& v);
Detail::Le64 le(std::int64_t& v);
Detail::Le64Const le(std::int64_t const& v);

}

std::ostream& operator<<(std::ostream&, Solana::Detail::Le32Const);
std::ostream& operator<<(std::ostream&, Solana::Detail::Le64Const);
std::istream& operator>>(std::istream&, Solana::Detail::Le32);
std::istream& operator>>(std::istream&, Solana::Detail::Le64);

namespace Solana { namespace Detail {

class Le32Const {
private:
	std::uint32_t v;

	friend
	std::ostream& ::operator<<(std::ostream&, Solana::Detail::Le32Const);

public:
	Le32Const(std::uint32_t const& v_) : v(v_) { }
};

class Le32 {
private:
	std::uint32_t& v;

	friend
	std::istream& ::operator>>(std::istream&, Solana::Detail::Le32);

public:
	Le32(std::uint32_t& v_) : v(v_) { }
	operator Le32Const() const { return Le32Const(v); }
};

class Le64Const {
private:
	std::uint64_t v;

	friend
	std::ostream& ::operator<<(std::ostream&, Solana::Detail::Le64Const);

public:
	Le64Const(std::uint64_t const& v_) : v(v_) { }
};

class Le64 {
private:
	std::uint64_t& v;

	friend
	std::istream& ::operator>>(std::istream&, Solana::Detail::Le64);

public:
	Le64(std::uint64_t& v_) : v(v_) { }
	operator Le64Const() const { return Le64Const(v); }
};

}}

#endif /* !defined(SOLANA_LE_HPP) */
