#ifndef SOLANA_DETAIL_BASE58BYTES_HPP
#define SOLANA_DETAIL_BASE58BYTES_HPP

#include"Util/Base58.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<iostream>
#include<stdexcept>
#include<string>
#include<string.h>
#include<vector>

namespace Solana { namespace Detail {

/** class Solana::Detail::Base58Bytes
 *
 * @brief a fixed-size byte string that is written
 * in base58 when rendered as text.
 *
 * @desc Public keys, blockhashes and signatures are
 * all of this form.
 * A default-constructed object is all zeros.
 */
template<std::size_t N>
class Base58Bytes {
protected:
	std::uint8_t raw[N];

public:
	Base58Bytes() { memset(raw, 0, N); }
	Base58Bytes(Base58Bytes const&) =default;
	Base58Bytes& operator=(Base58Bytes const&) =default;

	explicit
	Base58Bytes(std::string const& s) {
		auto bytes = std::vector<std::uint8_t>();
		if (!Util::Base58::decode(bytes, s) || bytes.size() != N)
			throw Util::BacktraceException<std::invalid_argument>(
				"Not a base58 string of "
				+ std::to_string(N)
				+ " bytes: " + s
			);
		memcpy(raw, bytes.data(), N);
	}
	static
	bool valid_string(std::string const& s) {
		auto bytes = std::vector<std::uint8_t>();
		return Util::Base58::decode(bytes, s) && bytes.size() == N;
	}

	explicit
	operator std::string() const {
		return Util::Base58::encode(raw, N);
	}

	static constexpr std::size_t size = N;
	std::uint8_t const* data() const { return raw; }

	void to_buffer(std::uint8_t d[N]) const {
		memcpy(d, raw, N);
	}
	void from_buffer(std::uint8_t const d[N]) {
		memcpy(raw, d, N);
	}

	bool operator==(Base58Bytes const& o) const {
		return memcmp(raw, o.raw, N) == 0;
	}
	bool operator!=(Base58Bytes const& o) const {
		return !(*this == o);
	}
	bool operator<(Base58Bytes const& o) const {
		return memcmp(raw, o.raw, N) < 0;
	}
};

template<std::size_t N>
inline
std::ostream& operator<<(std::ostream& os, Base58Bytes<N> const& b) {
	return os << std::string(b);
}

}}

#endif /* !defined(SOLANA_DETAIL_BASE58BYTES_HPP) */
