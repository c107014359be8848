#include "sqlacc_comparator.hpp"

#include "sqlacc_debug.hpp"

namespace sqlacc {

ValueSet ValueSetOf(const NormalizedRow &row) {
	return ValueSet(row.begin(), row.end());
}

bool IsSubset(const ValueSet &subset, const ValueSet &superset) {
	if (subset.size() > superset.size()) {
		return false;
	}
	for (auto &value : subset) {
		if (superset.find(value) == superset.end()) {
			return false;
		}
	}
	return true;
}

bool IsEquivalent(const NormalizedResultSet &actual, const NormalizedResultSet &predicted) {
	if (actual == predicted) {
		return true;
	}

	vector<ValueSet> actual_sets;
	actual_sets.reserve(actual.size());
	for (auto &row : actual) {
		actual_sets.push_back(ValueSetOf(row));
	}

	idx_t matches = 0;
	for (auto &row : predicted) {
		auto predicted_set = ValueSetOf(row);
		bool found = false;
		for (auto &actual_set : actual_sets) {
			if (IsSubset(actual_set, predicted_set) || IsSubset(predicted_set, actual_set)) {
				found = true;
				break;
			}
		}
		if (!found) {
			SQLACC_DEBUG_PRINT("IsEquivalent: no match for predicted row " + RowToString(row));
			return false;
		}
		matches++;
	}
	return matches == actual.size();
}

} // namespace sqlacc
