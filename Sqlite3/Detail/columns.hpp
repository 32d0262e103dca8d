#ifndef SQLITE3_DETAIL_COLUMNS_HPP
#define SQLITE3_DETAIL_COLUMNS_HPP

#include<cstdint>
#include<string>

namespace Sqlite3 { namespace Detail {

double column_d(void* stmt, int c);
std::int64_t column_i(void* stmt, int c);
std::string column_s(void* stmt, int c);

template<typename a>
struct Column;

template<>
struct Column<double> {
	static
	double column(void* stmt, int c) {
		return column_d(stmt, c);
	}
};

template<>
struct Column<int> {
	static
	int column(void* stmt, int c) {
		return column_i(stmt, c);
	}
};
template<>
struct Column<std::int64_t> {
	static
	std::int64_t column(void* stmt, int c) {
		return column_i(stmt, c);
	}
};

template<>
struct Column<std::string> {
	static
	std::string column(void* stmt, int c) {
		return column_s(stmt, c);
	}
};

}}

#endif /* !defined(SQLITE3_DETAIL_COLUMNS_HPP) */
