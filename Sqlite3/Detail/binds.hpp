#ifndef SQLITE3_DETAILS_BINDS_HPP
#define SQLITE3_DETAILS_BINDS_HPP

#include<cstdint>
#include<string>

namespace Sqlite3 { namespace Detail {

void bind_d(void* stmt, int l, double);
void bind_i(void* stmt, int l, std::int64_t);
void bind_s(void* stmt, int l, std::string);

template<typename a>
struct Bind;

template<>
struct Bind<double> {
	static void bind(void *stmt, int l, double v) {
		bind_d(stmt, l, v);
	}
};
template<>
struct Bind<std::int64_t> {
	static void bind(void *stmt, int l, std::int64_t v) {
		bind_i(stmt, l, v);
	}
};

template<>
struct Bind<char const*> {
	static void bind(void *stmt, int l, char const* v) {
		bind_s(stmt, l, v);
	}
};
template<>
struct Bind<std::string> {
	static void bind(void *stmt, int l, std::string v) {
		bind_s(stmt, l, std::move(v));
	}
};

}}

#endif /* !defined(SQLITE3_DETAILS_BINDS_HPP) */
