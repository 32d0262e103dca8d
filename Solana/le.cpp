#include"Solana/le.hpp"

std::ostream& operator<<(std::ostream& os, Solana::Detail::Le32Const o) {
	for (auto i = 0; i < 4; ++i)
		os.put(char((o.v >> (8 * i)) & 0xFF));
	return os;
}
std::istream& operator>>(std::istream& is, Solana::Detail::Le32 o) {
	char c[4];
	if (!is.read(c, sizeof(c)))
		return is;
	o.v = 0;
	for (auto i = 0; i < 4; ++i)
		o.v |= std::uint32_t(std::uint8_t(c[i])) << (8 * i);
	return is;
}
std::ostream& operator<<(std::ostream& os, Solana::Detail::Le64Const o) {
	for (auto i = 0; i < 8; ++i)
		os.put(char((o.v >> (8 * i)) & 0xFF));
	return os;
}
std::istream& operator>>(std::istream& is, Solana::Detail::Le64 o) {
	char c[8];
	if (!is.read(c, sizeof(c)))
		return is;
	o.v = 0;
	for (auto i = 0; i < 8; ++i)
		o.v |= std::uint64_t(std::uint8_t(c[i])) << (8 * i);
	return is;
}

namespace Solana {

Detail::Le32 le(std::uint32_t& v) {
	return Detail::Le32(v);
}
Detail::Le32Const le(std::uint32_t const& v) {
	return Detail::Le32Const(v);
}
Detail::Le64 le(std::uint64_t& v) {
	return Detail::Le64(v);
}
Detail::Le64Const le(std::uint64_t const& v) {
	return Detail::Le64Const(v);
}
Detail::Le64 le(std::int64_t& v) {
	return Detail::Le64(reinterpret_cast<std::uint64_t&>(v));
}
Detail::Le64Const le(std::int64_t const& v) {
	return Detail::Le64Const(reinterpret_cast<std::uint64_t const&>(v));
}

}
