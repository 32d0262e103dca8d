#include"Solana/shortvec.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace Solana {

Detail::ShortVec shortvec(std::uint16_t& v) {
	return Detail::ShortVec(v);
}
Detail::ShortVecConst shortvec(std::size_t v) {
	return Detail::ShortVecConst(v);
}

}

std::ostream& operator<<(std::ostream& os, Solana::Detail::ShortVecConst o) {
	if (o.v > 0xFFFF)
		throw Util::BacktraceException<std::length_error>(
			"Solana::shortvec: array too long"
		);
	auto v = o.v;
	for (;;) {
		auto b = std::uint8_t(v & 0x7F);
		v >>= 7;
		if (v == 0) {
			os.put(char(b));
			break;
		}
		os.put(char(b | 0x80));
	}
	return os;
}

std::istream& operator>>(std::istream& is, Solana::Detail::ShortVec o) {
	auto v = std::uint32_t(0);
	for (auto i = 0; i < 3; ++i) {
		auto c = char();
		if (!is.get(c))
			return is;
		auto b = std::uint8_t(c);
		/* The third byte carries only two bits.  */
		if (i == 2 && b > 0x03) {
			is.setstate(std::ios::failbit);
			return is;
		}
		v |= std::uint32_t(b & 0x7F) << (7 * i);
		if ((b & 0x80) == 0) {
			/* Reject non-minimal encodings.  */
			if (i > 0 && b == 0) {
				is.setstate(std::ios::failbit);
				return is;
			}
			o.v = std::uint16_t(v);
			return is;
		}
	}
	return is;
}
