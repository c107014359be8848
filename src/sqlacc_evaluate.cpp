//
// sqlacc_evaluate: execution accuracy of predicted SQL against reference SQL.
// Loads both dataset files, runs every pair through DuckDB and prints the running and final accuracy.
//

#include "duckdb.hpp"
#include "duckdb/common/error_data.hpp"

#include "sqlacc_config.hpp"
#include "sqlacc_dataset.hpp"
#include "sqlacc_executor.hpp"
#include "sqlacc_harness.hpp"
#include "sqlacc_log.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>

namespace sqlacc {

static std::atomic<bool> g_cancel_requested {false};

static void HandleInterrupt(int) {
	g_cancel_requested.store(true);
}

static void PrintDifficultyBreakdown(const EvaluationReport &report) {
	if (report.by_difficulty.empty()) {
		return;
	}
	Log("--- Accuracy by difficulty ---");
	for (auto &entry : report.by_difficulty) {
		Log("  " + entry.first + ": " + entry.second.ToString());
	}
}

static void PrintFailureBreakdown(const string &label, const std::map<string, idx_t> &failures, idx_t total) {
	if (failures.empty()) {
		return;
	}
	idx_t failed = 0;
	for (auto &entry : failures) {
		failed += entry.second;
	}
	Log("--- " + label + " execution failures (" + std::to_string(failed) + ") ---");
	for (auto &entry : failures) {
		Log("  " + entry.first + ": " + std::to_string(entry.second) + " (" +
		    FormatNumber(100.0 * static_cast<double>(entry.second) / static_cast<double>(std::max<idx_t>(1, total))) +
		    "%)");
	}
}

static int RunEvaluation(const EvaluatorConfig &config) {
	try {
		Log("Loading predictions from " + config.predictions_path);
		auto predictions = DatasetLoader::LoadFromFile(config.predictions_path);
		Log("Loading references from " + config.references_path);
		auto references = DatasetLoader::LoadFromFile(config.references_path);
		Log("Loaded " + std::to_string(predictions.size()) + " predicted and " + std::to_string(references.size()) +
		    " reference queries");

		if (config.UsesPostgres()) {
			Log("Query backend: postgres database '" + config.pg_dbname + "' at " + config.pg_host + ":" +
			    config.pg_port + " (via DuckDB)");
		} else {
			Log("Query backend: DuckDB " + (config.database_path.empty() ? string("in-memory database")
			                                                             : "database " + config.database_path));
		}
		Log("Timeout: " + FormatNumber(config.timeout_s) + "s");

		DuckDBQueryExecutor executor(config.ToExecutorOptions());
		AccuracyHarness harness(executor);

		idx_t pair_count = std::min(references.size(), predictions.size());
		idx_t log_interval = std::max<idx_t>(1, pair_count / 20);
		auto on_progress = [&](const PairOutcome &outcome, const AccuracyState &state) {
			if (!outcome.error.empty() && config.verbose) {
				Log("Pair " + std::to_string(outcome.index) + " not executed: " + outcome.error);
			}
			if (config.verbose || state.total % log_interval == 0 || state.total == pair_count) {
				Log("[" + std::to_string(state.total) + "/" + std::to_string(pair_count) +
				    "] ACCURACY: " + state.ToString());
			}
		};

		g_cancel_requested.store(false);
		std::signal(SIGINT, HandleInterrupt);
		auto report = harness.Run(references, predictions, on_progress, &g_cancel_requested);
		std::signal(SIGINT, SIG_DFL);

		std::cout << "FINAL ACCURACY: " << report.accuracy.ToString() << std::endl;

		PrintDifficultyBreakdown(report);
		PrintFailureBreakdown("Reference", report.reference_failures, report.accuracy.total);
		PrintFailureBreakdown("Predicted", report.predicted_failures, report.accuracy.total);
		if (report.cancelled) {
			Log("Run was interrupted; the accuracy covers the evaluated pairs only");
		}
		return 0;
	} catch (std::exception &ex) {
		duckdb::ErrorData error(ex);
		Log("Fatal error: " + error.Message());
		return 2;
	}
}

} // namespace sqlacc

int main(int argc, char **argv) {
	sqlacc::EvaluatorConfig config;
	try {
		config = sqlacc::ParseArguments(argc, argv);
	} catch (std::exception &ex) {
		duckdb::ErrorData error(ex);
		std::cerr << "Error: " << error.Message() << "\n";
		sqlacc::PrintUsage(std::cerr);
		return 1;
	}
	if (config.show_help) {
		sqlacc::PrintUsage(std::cout);
		return 0;
	}
	sqlacc::ApplyEnvironment(config, sqlacc::ReadEnvFile(config.env_file));
	return sqlacc::RunEvaluation(config);
}
