//
// Test command-line and environment configuration
//
#include <catch2/catch.hpp>

#include "duckdb/common/exception.hpp"
#include "sqlacc_config.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace sqlacc;

static EvaluatorConfig Parse(vector<string> args) {
	vector<const char *> argv;
	argv.push_back("sqlacc_evaluate");
	for (auto &arg : args) {
		argv.push_back(arg.c_str());
	}
	return ParseArguments(static_cast<int>(argv.size()), argv.data());
}

TEST_CASE("Defaults without arguments", "[config]") {
	auto config = Parse({});
	REQUIRE(config.predictions_path == "output.json");
	REQUIRE(config.references_path == "mini_dev_postgresql.json");
	REQUIRE(config.database_path.empty());
	REQUIRE(config.timeout_s == 10.0);
	REQUIRE(config.env_file == ".env");
	REQUIRE(config.verbose);
	REQUIRE_FALSE(config.show_help);
	REQUIRE_FALSE(config.UsesPostgres());
	REQUIRE(config.PostgresDSN().empty());
}

TEST_CASE("Flags override the defaults", "[config]") {
	auto config = Parse({"--predictions", "pred.json", "--references", "gold.json", "--database", "bird.duckdb",
	                     "--init", "schema.sql", "--timeout", "2.5", "--env", "local.env", "--quiet"});
	REQUIRE(config.predictions_path == "pred.json");
	REQUIRE(config.references_path == "gold.json");
	REQUIRE(config.database_path == "bird.duckdb");
	REQUIRE(config.init_script == "schema.sql");
	REQUIRE(config.timeout_s == 2.5);
	REQUIRE(config.env_file == "local.env");
	REQUIRE_FALSE(config.verbose);

	auto options = config.ToExecutorOptions();
	REQUIRE(options.database_path == "bird.duckdb");
	REQUIRE(options.init_script == "schema.sql");
	REQUIRE(options.timeout_s == 2.5);
	REQUIRE(options.postgres_dsn.empty());

	REQUIRE(Parse({"-h"}).show_help);
	REQUIRE(Parse({"--help"}).show_help);
}

TEST_CASE("Bad arguments are rejected", "[config]") {
	REQUIRE_THROWS_AS(Parse({"--bogus"}), duckdb::InvalidInputException);
	REQUIRE_THROWS_AS(Parse({"--predictions"}), duckdb::InvalidInputException);
	REQUIRE_THROWS_AS(Parse({"--timeout", "soon"}), duckdb::InvalidInputException);
	REQUIRE_THROWS_AS(Parse({"--timeout", "0"}), duckdb::InvalidInputException);
	REQUIRE_THROWS_AS(Parse({"--timeout", "-3"}), duckdb::InvalidInputException);
	REQUIRE_THROWS_AS(Parse({"--timeout", "5s"}), duckdb::InvalidInputException);
}

TEST_CASE("Environment files", "[config]") {
	string path = "/tmp/sqlacc_test.env";
	{
		std::ofstream out(path);
		out << "# postgres settings\n"
		    << "\n"
		    << "DB_NAME=bird\n"
		    << "export DB_USER = evaluator\n"
		    << "DB_PASSWORD=\"p a ss\"\n"
		    << "DB_HOST='db.internal'\n"
		    << "DB_PORT=6543 # non-default\n"
		    << "not a setting\n";
	}
	auto values = ReadEnvFile(path);
	std::remove(path.c_str());

	REQUIRE(values.size() == 5);
	REQUIRE(values.at("DB_NAME") == "bird");
	REQUIRE(values.at("DB_USER") == "evaluator");
	REQUIRE(values.at("DB_PASSWORD") == "p a ss");
	REQUIRE(values.at("DB_HOST") == "db.internal");
	REQUIRE(values.at("DB_PORT") == "6543");

	REQUIRE(ReadEnvFile("/tmp/sqlacc_missing.env").empty());
}

TEST_CASE("Process environment wins over the env file", "[config]") {
	const char *names[] = {"DB_NAME", "DB_USER", "DB_PASSWORD", "DB_HOST", "DB_PORT"};
	for (auto name : names) {
		unsetenv(name);
	}
	setenv("DB_USER", "from_process", 1);

	std::map<string, string> file_values {{"DB_NAME", "bird"}, {"DB_USER", "from_file"}, {"DB_PASSWORD", "it's"}};
	EvaluatorConfig config;
	ApplyEnvironment(config, file_values);
	unsetenv("DB_USER");

	REQUIRE(config.pg_dbname == "bird");
	REQUIRE(config.pg_user == "from_process");
	REQUIRE(config.pg_password == "it's");
	REQUIRE(config.pg_host == "localhost");
	REQUIRE(config.pg_port == "5432");
	REQUIRE(config.UsesPostgres());
	REQUIRE(config.PostgresDSN() == "dbname=bird user=from_process password='it\\'s' host=localhost port=5432");
	REQUIRE(config.ToExecutorOptions().postgres_dsn == config.PostgresDSN());
}

TEST_CASE("Usage text lists the options", "[config]") {
	std::ostringstream out;
	PrintUsage(out);
	auto text = out.str();
	REQUIRE(text.find("--predictions") != string::npos);
	REQUIRE(text.find("--timeout") != string::npos);
	REQUIRE(text.find("DB_NAME") != string::npos);
}
