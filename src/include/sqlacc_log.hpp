//
// Timestamped logging through the DuckDB printer
//

#ifndef SQLACC_LOG_HPP
#define SQLACC_LOG_HPP

#include <string>

namespace sqlacc {

using std::string;

// Current local time as "YYYY-MM-DD HH:MM:SS"
string Timestamp();

// Print "[timestamp] msg" through the DuckDB printer (stderr)
void Log(const string &msg);

// Format a double without trailing zeros (e.g. 0.100000 -> 0.1, 2.5000 -> 2.5)
string FormatNumber(double v);

} // namespace sqlacc

#endif // SQLACC_LOG_HPP
