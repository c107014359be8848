//
// Query execution interface consumed by the accuracy harness, and its DuckDB implementation.
//

#ifndef SQLACC_EXECUTOR_HPP
#define SQLACC_EXECUTOR_HPP

#include "duckdb.hpp"
#include "sqlacc_value.hpp"

namespace sqlacc {

enum class ExecutionState : uint8_t { SUCCESS, FAILED, TIMEOUT, REJECTED, CRASH };

// "success", "error", "timeout", "rejected", "crash"
string ExecutionStateToString(ExecutionState state);

// Outcome of running one SQL text. `columns`, `data` and `row_count` are only meaningful on SUCCESS.
struct QueryResult {
	ExecutionState state = ExecutionState::FAILED;
	vector<string> columns;
	vector<Row> data;
	idx_t row_count = 0;
	string error;
	double time_ms = 0;

	bool HasData() const {
		return state == ExecutionState::SUCCESS;
	}

	static QueryResult Failure(ExecutionState state, string error);
};

// Runs SQL text and reports rows or an error. Implementations never throw from Execute: every failure,
// including statements refused as unsafe and timeouts, is reported through QueryResult::state.
class QueryExecutor {
public:
	virtual ~QueryExecutor() = default;
	virtual QueryResult Execute(const string &sql) = 0;
};

struct DuckDBExecutorOptions {
	// DuckDB database file; empty opens an in-memory database
	string database_path;
	// libpq connection string; when set the database is attached read-only through the postgres extension
	// and made the default catalog
	string postgres_dsn;
	// SQL file run once after connecting, statement by statement
	string init_script;
	// per-query time limit in seconds
	double timeout_s = 10.0;
};

// QueryExecutor backed by a DuckDB connection.
//
// Only SELECT statements are executed; anything else is REJECTED with "Query not supported.". With a postgres
// database attached the check still runs on DuckDB's parser, but the query itself is handed to postgres. Each query runs
// on a worker thread and is interrupted once the timeout expires. When a query invalidates the database the
// result is a CRASH and the connection is re-opened before the next query.
class DuckDBQueryExecutor : public QueryExecutor {
public:
	// Throws duckdb::IOException if the database cannot be prepared (attach or init script failure)
	explicit DuckDBQueryExecutor(DuckDBExecutorOptions options);

	QueryResult Execute(const string &sql) override;

	duckdb::Connection &GetConnection();

	// Map one DuckDB value onto the raw cell model
	static RawValue ConvertValue(const duckdb::Value &value);

	// Wrap one statement into a postgres_query() call against the attached postgres catalog, so postgres parses,
	// binds and runs it. Trailing semicolons are dropped.
	static string PostgresPassthroughQuery(const string &statement);

private:
	void Connect();
	void AttachPostgres();
	void RunInitScript();
	// SUCCESS if every statement is a SELECT, otherwise the state/error to report.
	// On success `run_sql` is the text to execute: `sql` itself, or its postgres passthrough in postgres mode.
	QueryResult CheckReadOnly(const string &sql, string &run_sql);

	DuckDBExecutorOptions options;
	duckdb::unique_ptr<duckdb::DuckDB> db;
	duckdb::unique_ptr<duckdb::Connection> con;
};

} // namespace sqlacc

#endif // SQLACC_EXECUTOR_HPP
