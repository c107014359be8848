#include "sqlacc_config.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

#include <cstdlib>
#include <fstream>

namespace sqlacc {

using duckdb::InvalidInputException;
using duckdb::StringUtil;

static double ParseTimeout(const string &text) {
	char *end = nullptr;
	double value = std::strtod(text.c_str(), &end);
	if (text.empty() || end == text.c_str() || *end != '\0' || !(value > 0)) {
		throw InvalidInputException("Invalid --timeout value '" + text + "': expected a positive number of seconds");
	}
	return value;
}

EvaluatorConfig ParseArguments(int argc, const char *const *argv) {
	EvaluatorConfig config;
	for (int i = 1; i < argc; ++i) {
		string arg = argv[i];
		auto need = [&]() -> string {
			if (i + 1 >= argc) {
				throw InvalidInputException("Missing value for " + arg);
			}
			return string(argv[++i]);
		};

		if (arg == "-h" || arg == "--help") {
			config.show_help = true;
		} else if (arg == "--predictions") {
			config.predictions_path = need();
		} else if (arg == "--references") {
			config.references_path = need();
		} else if (arg == "--database") {
			config.database_path = need();
		} else if (arg == "--init") {
			config.init_script = need();
		} else if (arg == "--timeout") {
			config.timeout_s = ParseTimeout(need());
		} else if (arg == "--env") {
			config.env_file = need();
		} else if (arg == "--quiet") {
			config.verbose = false;
		} else {
			throw InvalidInputException("Unknown option: " + arg);
		}
	}
	return config;
}

std::map<string, string> ReadEnvFile(const string &path) {
	std::map<string, string> values;
	std::ifstream file(path);
	if (!file.is_open()) {
		return values;
	}
	string line;
	while (std::getline(file, line)) {
		StringUtil::Trim(line);
		if (line.empty() || line[0] == '#') {
			continue;
		}
		if (StringUtil::StartsWith(line, "export ")) {
			line = line.substr(7);
		}
		auto pos = line.find('=');
		if (pos == string::npos) {
			continue;
		}
		string key = line.substr(0, pos);
		string value = line.substr(pos + 1);
		StringUtil::Trim(key);
		StringUtil::Trim(value);
		if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
			value = value.substr(1, value.size() - 2);
		} else {
			// unquoted values may carry a trailing comment
			auto comment_pos = value.find(" #");
			if (comment_pos != string::npos) {
				value = value.substr(0, comment_pos);
				StringUtil::Trim(value);
			}
		}
		if (!key.empty()) {
			values[key] = value;
		}
	}
	return values;
}

void ApplyEnvironment(EvaluatorConfig &config, const std::map<string, string> &env_file_values) {
	auto lookup = [&](const char *name, string &target) {
		const char *from_process = std::getenv(name);
		if (from_process) {
			target = from_process;
			return;
		}
		auto it = env_file_values.find(name);
		if (it != env_file_values.end()) {
			target = it->second;
		}
	};
	lookup("DB_NAME", config.pg_dbname);
	lookup("DB_USER", config.pg_user);
	lookup("DB_PASSWORD", config.pg_password);
	lookup("DB_HOST", config.pg_host);
	lookup("DB_PORT", config.pg_port);
}

// libpq quoting: values with spaces, quotes or backslashes are single-quoted and escaped
static string QuoteConnectionValue(const string &value) {
	if (!value.empty() && value.find_first_of(" '\\\t") == string::npos) {
		return value;
	}
	string quoted = "'";
	for (char c : value) {
		if (c == '\'' || c == '\\') {
			quoted += '\\';
		}
		quoted += c;
	}
	quoted += "'";
	return quoted;
}

string EvaluatorConfig::PostgresDSN() const {
	if (!UsesPostgres()) {
		return string();
	}
	string dsn = "dbname=" + QuoteConnectionValue(pg_dbname);
	if (!pg_user.empty()) {
		dsn += " user=" + QuoteConnectionValue(pg_user);
	}
	if (!pg_password.empty()) {
		dsn += " password=" + QuoteConnectionValue(pg_password);
	}
	if (!pg_host.empty()) {
		dsn += " host=" + QuoteConnectionValue(pg_host);
	}
	if (!pg_port.empty()) {
		dsn += " port=" + QuoteConnectionValue(pg_port);
	}
	return dsn;
}

DuckDBExecutorOptions EvaluatorConfig::ToExecutorOptions() const {
	DuckDBExecutorOptions options;
	options.database_path = database_path;
	options.postgres_dsn = PostgresDSN();
	options.init_script = init_script;
	options.timeout_s = timeout_s;
	return options;
}

void PrintUsage(std::ostream &out) {
	out << "Usage: sqlacc_evaluate [options]\n"
	    << "Scores predicted SQL queries against reference queries by executing both and comparing results.\n"
	    << "Options:\n"
	    << "  --predictions <json>  Predicted queries (default: output.json)\n"
	    << "  --references <json>   Reference queries (default: mini_dev_postgresql.json)\n"
	    << "  --database <path>     DuckDB database file (default: in-memory)\n"
	    << "  --init <sql>          SQL script run once after connecting\n"
	    << "  --timeout <sec>       Per-query timeout in seconds (default: 10)\n"
	    << "  --env <path>          Environment file with DB_* settings (default: .env)\n"
	    << "  --quiet               Only log progress every 5% of the pairs\n"
	    << "  -h, --help            Show this help message\n"
	    << "Environment:\n"
	    << "  DB_NAME, DB_USER, DB_PASSWORD, DB_HOST (localhost), DB_PORT (5432)\n"
	    << "  When DB_NAME is set the postgres database is attached read-only and queried through DuckDB.\n";
}

} // namespace sqlacc
