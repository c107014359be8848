//
// Accuracy Harness - runs reference/predicted query pairs and accumulates execution accuracy
//

#ifndef SQLACC_HARNESS_HPP
#define SQLACC_HARNESS_HPP

#include "sqlacc_dataset.hpp"
#include "sqlacc_executor.hpp"

#include <atomic>
#include <functional>
#include <map>

namespace sqlacc {

// Running counters of one evaluation. Only ever grows.
struct AccuracyState {
	idx_t correct = 0;
	idx_t total = 0;

	// correct / total, 0 when nothing was evaluated
	double Accuracy() const;
	// Accuracy rounded to 3 decimals
	double RoundedAccuracy() const;
	// "<correct>/<total> = <accuracy>", e.g. "2/3 = 0.667", "3/3 = 1.0"
	string ToString() const;

	void Record(bool is_correct) {
		total++;
		if (is_correct) {
			correct++;
		}
	}
};

// Render an accuracy with at most 3 decimals and at least one fractional digit (0.5, 0.667, 1.0)
string FormatAccuracy(double accuracy);

struct PairOutcome {
	idx_t index = 0;
	ExecutionState reference_state = ExecutionState::FAILED;
	ExecutionState predicted_state = ExecutionState::FAILED;
	bool correct = false;
	// first execution error of the pair, empty when both sides ran
	string error;
};

struct EvaluationReport {
	AccuracyState accuracy;
	// keyed by the reference entry's difficulty; entries without one are not tracked
	std::map<string, AccuracyState> by_difficulty;
	// execution failures per state ("error", "timeout", ...) for each side
	std::map<string, idx_t> reference_failures;
	std::map<string, idx_t> predicted_failures;
	bool cancelled = false;
};

using ProgressCallback = std::function<void(const PairOutcome &outcome, const AccuracyState &state)>;

// Drives index-aligned reference/predicted descriptors through a QueryExecutor, one pair at a time and in order.
// A pair counts as correct only when both queries return data and the normalized result sets are equivalent.
// Execution failures are counted against the pair and never stop the run.
class AccuracyHarness {
public:
	explicit AccuracyHarness(QueryExecutor &executor_p) : executor(executor_p) {
	}

	// Run one pair; executes the reference first, then the prediction
	PairOutcome EvaluatePair(idx_t index, const QueryDescriptor &reference, const QueryDescriptor &predicted);

	// Evaluate min(|references|, |predictions|) pairs. `on_progress` is called after every pair. When `cancel`
	// becomes true the run stops before the next pair and the report is marked cancelled.
	EvaluationReport Run(const vector<QueryDescriptor> &references, const vector<QueryDescriptor> &predictions,
	                     const ProgressCallback &on_progress = nullptr, const std::atomic<bool> *cancel = nullptr);

private:
	QueryExecutor &executor;
};

} // namespace sqlacc

#endif // SQLACC_HARNESS_HPP
