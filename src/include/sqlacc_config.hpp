//
// Configuration of the evaluator CLI: command-line flags plus DB_* settings from the environment / .env file
//

#ifndef SQLACC_CONFIG_HPP
#define SQLACC_CONFIG_HPP

#include "sqlacc_executor.hpp"

#include <map>
#include <ostream>

namespace sqlacc {

struct EvaluatorConfig {
	string predictions_path = "output.json";
	string references_path = "mini_dev_postgresql.json";
	// DuckDB database file, empty for in-memory
	string database_path;
	string init_script;
	// per-query timeout in seconds
	double timeout_s = 10.0;
	string env_file = ".env";
	// log every pair instead of a sparse progress line
	bool verbose = true;
	bool show_help = false;

	// postgres connection (DB_NAME, DB_USER, DB_PASSWORD, DB_HOST, DB_PORT)
	string pg_dbname;
	string pg_user;
	string pg_password;
	string pg_host = "localhost";
	string pg_port = "5432";

	bool UsesPostgres() const {
		return !pg_dbname.empty();
	}
	// libpq key/value connection string, values quoted where needed
	string PostgresDSN() const;
	DuckDBExecutorOptions ToExecutorOptions() const;
};

// Parse command-line flags. Throws duckdb::InvalidInputException on unknown flags, missing values or a
// timeout that is not a positive number.
EvaluatorConfig ParseArguments(int argc, const char *const *argv);

// Read KEY=VALUE lines (comments, blank lines, "export " prefixes and quoted values allowed).
// A missing file yields an empty map.
std::map<string, string> ReadEnvFile(const string &path);

// Fill the postgres settings: process environment first, then values from the .env file.
void ApplyEnvironment(EvaluatorConfig &config, const std::map<string, string> &env_file_values);

void PrintUsage(std::ostream &out);

} // namespace sqlacc

#endif // SQLACC_CONFIG_HPP
