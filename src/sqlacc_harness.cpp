#include "sqlacc_harness.hpp"

#include "duckdb/common/error_data.hpp"

#include "sqlacc_comparator.hpp"
#include "sqlacc_debug.hpp"
#include "sqlacc_log.hpp"
#include "sqlacc_normalizer.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>

namespace sqlacc {

static constexpr int ACCURACY_DECIMAL_DIGITS = 3;

static string FormatRounded(double value) {
	char buf[64];
	snprintf(buf, sizeof(buf), "%.*f", ACCURACY_DECIMAL_DIGITS, value);
	return string(buf);
}

double AccuracyState::Accuracy() const {
	if (total == 0) {
		return 0;
	}
	return static_cast<double>(correct) / static_cast<double>(total);
}

double AccuracyState::RoundedAccuracy() const {
	return std::strtod(FormatRounded(Accuracy()).c_str(), nullptr);
}

string AccuracyState::ToString() const {
	return std::to_string(correct) + "/" + std::to_string(total) + " = " + FormatAccuracy(Accuracy());
}

string FormatAccuracy(double accuracy) {
	string s = FormatRounded(accuracy);
	// keep one digit after the point: 1.000 -> 1.0, 0.500 -> 0.5
	while (s.size() > 2 && s.back() == '0' && s[s.size() - 2] != '.') {
		s.pop_back();
	}
	return s;
}

PairOutcome AccuracyHarness::EvaluatePair(idx_t index, const QueryDescriptor &reference,
                                          const QueryDescriptor &predicted) {
	PairOutcome outcome;
	outcome.index = index;

	auto reference_result = executor.Execute(reference.sql);
	auto predicted_result = executor.Execute(predicted.sql);
	outcome.reference_state = reference_result.state;
	outcome.predicted_state = predicted_result.state;

	if (!reference_result.HasData()) {
		outcome.error = "reference: " + reference_result.error;
		return outcome;
	}
	if (!predicted_result.HasData()) {
		outcome.error = "predicted: " + predicted_result.error;
		return outcome;
	}

	auto actual_rows = NormalizeResultSet(reference_result.data);
	auto predicted_rows = NormalizeResultSet(predicted_result.data);
	outcome.correct = IsEquivalent(actual_rows, predicted_rows);
	SQLACC_DEBUG_PRINT("Pair " + std::to_string(index) + ": " + std::to_string(actual_rows.size()) + " vs " +
	                   std::to_string(predicted_rows.size()) + " rows, " + (outcome.correct ? "match" : "mismatch"));
	return outcome;
}

EvaluationReport AccuracyHarness::Run(const vector<QueryDescriptor> &references,
                                      const vector<QueryDescriptor> &predictions, const ProgressCallback &on_progress,
                                      const std::atomic<bool> *cancel) {
	EvaluationReport report;
	if (references.size() != predictions.size()) {
		Log("Warning: " + std::to_string(references.size()) + " reference queries but " +
		    std::to_string(predictions.size()) + " predicted queries; evaluating the first " +
		    std::to_string(std::min(references.size(), predictions.size())) + " pairs");
	}
	idx_t pair_count = std::min(references.size(), predictions.size());

	for (idx_t i = 0; i < pair_count; i++) {
		if (cancel && cancel->load()) {
			Log("Evaluation cancelled after " + std::to_string(i) + " pairs");
			report.cancelled = true;
			break;
		}
		auto &reference = references[i];
		PairOutcome outcome;
		try {
			outcome = EvaluatePair(i, reference, predictions[i]);
		} catch (std::exception &ex) {
			duckdb::ErrorData error(ex);
			outcome.index = i;
			outcome.correct = false;
			outcome.error = error.Message();
			Log("Pair " + std::to_string(i) + " could not be evaluated: " + outcome.error);
		}

		report.accuracy.Record(outcome.correct);
		if (!reference.difficulty.empty()) {
			report.by_difficulty[reference.difficulty].Record(outcome.correct);
		}
		if (outcome.reference_state != ExecutionState::SUCCESS) {
			report.reference_failures[ExecutionStateToString(outcome.reference_state)]++;
		}
		if (outcome.predicted_state != ExecutionState::SUCCESS) {
			report.predicted_failures[ExecutionStateToString(outcome.predicted_state)]++;
		}

		if (on_progress) {
			on_progress(outcome, report.accuracy);
		}
	}
	return report;
}

} // namespace sqlacc
