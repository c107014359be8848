//
// Normalization of cells, rows and whole result sets into comparable form.
//

#ifndef SQLACC_NORMALIZER_HPP
#define SQLACC_NORMALIZER_HPP

#include "sqlacc_value.hpp"

namespace sqlacc {

// Number of fractional digits numeric values are rounded to.
static constexpr int NORMALIZE_DECIMAL_DIGITS = 5;

// Canonicalize one cell:
// - text is trimmed and lower-cased; "true"/"yes"/"1" become the number 1 and "false"/"no"/"0" the number 0
// - booleans become the number 1 or 0
// - integers, floats and decimals become a double rounded to 5 fractional digits
// - NULL and opaque values are returned unchanged
// Pure and idempotent.
NormalizedValue NormalizeValue(const RawValue &value);

// Strip leading/trailing Unicode whitespace and lower-case every codepoint (UTF-8 aware).
// Text that is not valid UTF-8 is folded byte-wise on ASCII only.
string FoldText(const string &text);

// Round to 5 fractional digits, correctly rounded on the exact binary value (ties to even).
// Non-finite values are returned unchanged.
double RoundNormalized(double value);

// Turn a normalized value back into a raw one (number -> float, text -> text, null -> null, other -> other).
RawValue ToRawValue(const NormalizedValue &value);

// Element-wise NormalizeValue; keeps column count and order.
NormalizedRow NormalizeRow(const Row &row);

// Normalize every row and drop duplicates. Row order is discarded.
NormalizedResultSet NormalizeResultSet(const vector<Row> &rows);

// Re-normalize an already normalized set; yields an equal set.
NormalizedResultSet NormalizeResultSet(const NormalizedResultSet &rows);

} // namespace sqlacc

#endif // SQLACC_NORMALIZER_HPP
