#include "sqlacc_executor.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/types/value.hpp"
#include "duckdb/main/connection.hpp"
#include "duckdb/parser/keyword_helper.hpp"
#include "duckdb/parser/sql_statement.hpp"

#include "sqlacc_debug.hpp"
#include "sqlacc_log.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <fstream>
#include <sstream>
#include <thread>

namespace sqlacc {

using duckdb::Connection;
using duckdb::DuckDB;
using duckdb::LogicalTypeId;
using duckdb::MaterializedQueryResult;
using duckdb::Value;

static constexpr idx_t MAX_ERROR_LENGTH = 200;
// catalog name the postgres database is attached under
static constexpr const char *POSTGRES_CATALOG = "pg";

string ExecutionStateToString(ExecutionState state) {
	switch (state) {
	case ExecutionState::SUCCESS:
		return "success";
	case ExecutionState::FAILED:
		return "error";
	case ExecutionState::TIMEOUT:
		return "timeout";
	case ExecutionState::REJECTED:
		return "rejected";
	case ExecutionState::CRASH:
		return "crash";
	}
	return "unknown";
}

QueryResult QueryResult::Failure(ExecutionState state, string error) {
	QueryResult result;
	result.state = state;
	result.error = std::move(error);
	return result;
}

// Strip stack traces and cap the length so errors group cleanly in reports
static string CleanError(const string &error) {
	string cleaned = error;
	auto stack_pos = cleaned.find("\n\nStack Trace");
	if (stack_pos != string::npos) {
		cleaned = cleaned.substr(0, stack_pos);
	}
	if (cleaned.size() > MAX_ERROR_LENGTH) {
		cleaned = cleaned.substr(0, MAX_ERROR_LENGTH);
	}
	return cleaned;
}

static ExecutionState ClassifyError(const string &error) {
	if (error.find("FATAL") != string::npos || error.find("database has been invalidated") != string::npos) {
		return ExecutionState::CRASH;
	}
	if (error.find("INTERRUPT") != string::npos || error.find("Interrupted") != string::npos) {
		return ExecutionState::TIMEOUT;
	}
	return ExecutionState::FAILED;
}

static string ReadFileToString(const string &path) {
	std::ifstream in(path);
	if (!in.is_open()) {
		return string();
	}
	std::ostringstream ss;
	ss << in.rdbuf();
	return ss.str();
}

DuckDBQueryExecutor::DuckDBQueryExecutor(DuckDBExecutorOptions options_p) : options(std::move(options_p)) {
	Connect();
	if (!options.init_script.empty()) {
		RunInitScript();
	}
}

void DuckDBQueryExecutor::Connect() {
	con.reset();
	db.reset();
	if (options.database_path.empty()) {
		db = duckdb::make_uniq<DuckDB>(nullptr);
	} else {
		db = duckdb::make_uniq<DuckDB>(options.database_path);
	}
	con = duckdb::make_uniq<Connection>(*db);
	if (!options.postgres_dsn.empty()) {
		AttachPostgres();
	}
}

void DuckDBQueryExecutor::AttachPostgres() {
	for (auto &stmt : {"INSTALL postgres;", "LOAD postgres;"}) {
		auto r = con->Query(stmt);
		if (r->HasError()) {
			throw duckdb::IOException("Failed to set up postgres extension: " + CleanError(r->GetError()));
		}
	}
	string attach =
	    "ATTACH " + duckdb::KeywordHelper::WriteQuoted(options.postgres_dsn, '\'') + " AS " + string(POSTGRES_CATALOG) + " (TYPE postgres, READ_ONLY);";
	auto r_attach = con->Query(attach);
	if (r_attach->HasError()) {
		throw duckdb::IOException("Failed to attach postgres database: " + CleanError(r_attach->GetError()));
	}
	auto r_use = con->Query("USE " + string(POSTGRES_CATALOG) + ";");
	if (r_use->HasError()) {
		throw duckdb::IOException("Failed to select postgres database: " + CleanError(r_use->GetError()));
	}
	Log("Attached postgres database (read-only)");
}

// Execute the init script statement by statement
void DuckDBQueryExecutor::RunInitScript() {
	Log("Running init script: " + options.init_script);
	string script_sql = ReadFileToString(options.init_script);
	if (script_sql.empty()) {
		throw duckdb::IOException("Init script is missing or empty: " + options.init_script);
	}

	std::istringstream sql_stream(script_sql);
	string line;
	string current_statement;
	idx_t executed = 0;

	auto run_statement = [&](const string &statement) {
		auto result = con->Query(statement);
		if (result->HasError()) {
			throw duckdb::IOException("Init script error: " + CleanError(result->GetError()) +
			                          "\nStatement: " + statement);
		}
		executed++;
	};

	while (std::getline(sql_stream, line)) {
		string trimmed = line;
		size_t start = trimmed.find_first_not_of(" \t\r\n");
		if (start == string::npos) {
			continue;
		}
		trimmed = trimmed.substr(start);
		if (trimmed.substr(0, 2) == "--") {
			continue;
		}

		current_statement += line + "\n";

		if (trimmed.find(';') != string::npos) {
			run_statement(current_statement);
			current_statement.clear();
		}
	}

	if (current_statement.find_first_not_of(" \t\r\n") != string::npos) {
		run_statement(current_statement);
	}

	Log("Init script done (" + std::to_string(executed) + " statements)");
}

duckdb::Connection &DuckDBQueryExecutor::GetConnection() {
	if (!con) {
		throw duckdb::InternalException("DuckDBQueryExecutor has no open connection");
	}
	return *con;
}

RawValue DuckDBQueryExecutor::ConvertValue(const Value &value) {
	if (value.IsNull()) {
		return RawValue::Null();
	}
	switch (value.type().id()) {
	case LogicalTypeId::BOOLEAN:
		return RawValue::Boolean(value.GetValue<bool>());
	case LogicalTypeId::TINYINT:
	case LogicalTypeId::SMALLINT:
	case LogicalTypeId::INTEGER:
	case LogicalTypeId::BIGINT:
	case LogicalTypeId::UTINYINT:
	case LogicalTypeId::USMALLINT:
	case LogicalTypeId::UINTEGER:
		return RawValue::Integer(value.GetValue<int64_t>());
	case LogicalTypeId::UBIGINT:
	case LogicalTypeId::HUGEINT:
	case LogicalTypeId::UHUGEINT:
		// may not fit int64_t; the exact digits convert like a decimal
		return RawValue::Decimal(value.ToString());
	case LogicalTypeId::FLOAT:
	case LogicalTypeId::DOUBLE:
		return RawValue::Float(value.GetValue<double>());
	case LogicalTypeId::DECIMAL:
		return RawValue::Decimal(value.ToString());
	case LogicalTypeId::VARCHAR:
		return RawValue::Text(duckdb::StringValue::Get(value));
	case LogicalTypeId::ENUM:
	case LogicalTypeId::UUID:
		// postgres clients receive these as strings
		return RawValue::Text(value.ToString());
	default:
		return RawValue::Other(value.type().ToString(), value.ToString());
	}
}

string DuckDBQueryExecutor::PostgresPassthroughQuery(const string &statement) {
	string text = statement;
	duckdb::StringUtil::Trim(text);
	while (!text.empty() && text.back() == ';') {
		text.pop_back();
		duckdb::StringUtil::RTrim(text);
	}
	return "SELECT * FROM postgres_query(" + duckdb::KeywordHelper::WriteQuoted(POSTGRES_CATALOG, '\'') + ", " +
	       duckdb::KeywordHelper::WriteQuoted(text, '\'') + ")";
}

QueryResult DuckDBQueryExecutor::CheckReadOnly(const string &sql, string &run_sql) {
	duckdb::vector<duckdb::unique_ptr<duckdb::SQLStatement>> statements;
	try {
		statements = con->ExtractStatements(sql);
	} catch (std::exception &ex) {
		duckdb::ErrorData error(ex);
		return QueryResult::Failure(ExecutionState::FAILED, CleanError(error.Message()));
	}
	if (statements.empty()) {
		return QueryResult::Failure(ExecutionState::REJECTED, "Query not supported.");
	}
	for (auto &statement : statements) {
		if (statement->type != duckdb::StatementType::SELECT_STATEMENT) {
			return QueryResult::Failure(ExecutionState::REJECTED, "Query not supported.");
		}
	}
	if (options.postgres_dsn.empty()) {
		run_sql = sql;
	} else {
		// only the last statement's rows are returned
		auto &last = *statements.back();
		if (last.query.empty() || last.stmt_location >= last.query.size()) {
			run_sql = PostgresPassthroughQuery(sql);
		} else {
			auto length = last.stmt_length == 0 ? string::npos : last.stmt_length;
			run_sql = PostgresPassthroughQuery(last.query.substr(last.stmt_location, length));
		}
	}
	QueryResult ok;
	ok.state = ExecutionState::SUCCESS;
	return ok;
}

QueryResult DuckDBQueryExecutor::Execute(const string &sql) {
	if (!con) {
		try {
			Log("No open connection, reconnecting...");
			Connect();
		} catch (std::exception &ex) {
			duckdb::ErrorData error(ex);
			return QueryResult::Failure(ExecutionState::CRASH, CleanError(error.Message()));
		}
	}

	string run_sql;
	auto check = CheckReadOnly(sql, run_sql);
	if (check.state != ExecutionState::SUCCESS) {
		SQLACC_DEBUG_PRINT("Refused query: " + check.error);
		return check;
	}

	QueryResult qr;
	try {
		duckdb::unique_ptr<MaterializedQueryResult> result;
		std::atomic<bool> query_done {false};
		std::exception_ptr query_exception;
		auto &connection = *con;

		auto start = std::chrono::steady_clock::now();
		std::thread query_thread([&]() {
			try {
				result = connection.Query(run_sql);
			} catch (...) {
				query_exception = std::current_exception();
			}
			query_done.store(true, std::memory_order_release);
		});

		auto deadline = start + std::chrono::duration<double>(options.timeout_s);
		bool interrupted = false;
		while (!query_done.load(std::memory_order_acquire)) {
			if (std::chrono::steady_clock::now() >= deadline) {
				connection.Interrupt();
				interrupted = true;
				break;
			}
			std::this_thread::sleep_for(std::chrono::milliseconds(10));
		}
		query_thread.join();
		auto end = std::chrono::steady_clock::now();
		qr.time_ms = std::chrono::duration<double, std::milli>(end - start).count();

		if (query_exception) {
			std::rethrow_exception(query_exception);
		}

		if (result && result->HasError()) {
			qr.error = CleanError(result->GetError());
			qr.state = interrupted ? ExecutionState::TIMEOUT : ClassifyError(qr.error);
		} else if (interrupted) {
			qr.state = ExecutionState::TIMEOUT;
			qr.error = "Query exceeded the " + FormatNumber(options.timeout_s) + "s timeout";
		} else if (!result) {
			qr.state = ExecutionState::FAILED;
			qr.error = "Query produced no result";
		} else {
			qr.state = ExecutionState::SUCCESS;
			qr.columns.assign(result->names.begin(), result->names.end());
			auto column_count = result->ColumnCount();
			auto row_count = result->RowCount();
			qr.data.reserve(row_count);
			for (idx_t row = 0; row < row_count; row++) {
				Row values;
				values.reserve(column_count);
				for (idx_t col = 0; col < column_count; col++) {
					values.push_back(ConvertValue(result->GetValue(col, row)));
				}
				qr.data.push_back(std::move(values));
			}
			qr.row_count = row_count;
		}
	} catch (std::exception &ex) {
		duckdb::ErrorData error(ex);
		qr.error = CleanError(error.Message());
		qr.state = ClassifyError(qr.error);
	}

	if (qr.state == ExecutionState::CRASH) {
		Log("Database crash: " + qr.error);
		Log("  reconnecting...");
		try {
			Connect();
		} catch (std::exception &ex) {
			// the next Execute retries the connection
			duckdb::ErrorData error(ex);
			Log("Reconnect failed: " + error.Message());
			con.reset();
			db.reset();
		}
	}
	return qr;
}

} // namespace sqlacc
