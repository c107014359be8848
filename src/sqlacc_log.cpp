#include "sqlacc_log.hpp"

#include "duckdb.hpp"
#include "duckdb/common/printer.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sqlacc {

string Timestamp() {
	auto now = std::chrono::system_clock::now();
	std::time_t t = std::chrono::system_clock::to_time_t(now);
	char buf[64];
	std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", std::localtime(&t));
	return string(buf);
}

void Log(const string &msg) {
	duckdb::Printer::Print("[" + Timestamp() + "] " + msg);
}

string FormatNumber(double v) {
	std::ostringstream oss;
	oss << std::setprecision(15) << std::defaultfloat << v;
	string s = oss.str();
	auto pos = s.find('.');
	if (pos != string::npos && s.find('e') == string::npos) {
		while (!s.empty() && s.back() == '0') {
			s.pop_back();
		}
		if (!s.empty() && s.back() == '.') {
			s.pop_back();
		}
	}
	return s;
}

} // namespace sqlacc
