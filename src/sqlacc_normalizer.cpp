#include "sqlacc_normalizer.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "utf8proc.hpp"
#include "utf8proc_wrapper.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace sqlacc {

using duckdb::StringUtil;
using duckdb::Utf8Proc;

static bool IsTrueToken(const string &text) {
	return text == "true" || text == "yes" || text == "1";
}

static bool IsFalseToken(const string &text) {
	return text == "false" || text == "no" || text == "0";
}

// Whitespace: \t..\r, \x1c..\x20, U+0085 and the Zs/Zl/Zp categories
static bool IsUnicodeSpace(int32_t codepoint) {
	if ((codepoint >= 0x09 && codepoint <= 0x0D) || (codepoint >= 0x1C && codepoint <= 0x20) || codepoint == 0x85) {
		return true;
	}
	if (codepoint < 0x80) {
		return false;
	}
	auto category = duckdb::utf8proc_category(codepoint);
	return category == duckdb::UTF8PROC_CATEGORY_ZS || category == duckdb::UTF8PROC_CATEGORY_ZL ||
	       category == duckdb::UTF8PROC_CATEGORY_ZP;
}

string FoldText(const string &text) {
	if (Utf8Proc::Analyze(text.c_str(), text.size()) == duckdb::UnicodeType::INVALID) {
		string folded = text;
		StringUtil::Trim(folded);
		return StringUtil::Lower(folded);
	}
	vector<int32_t> codepoints;
	codepoints.reserve(text.size());
	for (idx_t pos = 0; pos < text.size();) {
		int size = 0;
		codepoints.push_back(Utf8Proc::UTF8ToCodepoint(text.c_str() + pos, size));
		pos += static_cast<idx_t>(size);
	}
	idx_t begin = 0;
	idx_t end = codepoints.size();
	while (begin < end && IsUnicodeSpace(codepoints[begin])) {
		begin++;
	}
	while (end > begin && IsUnicodeSpace(codepoints[end - 1])) {
		end--;
	}

	// same simple case mapping as DuckDB's lower()
	string folded;
	folded.reserve(text.size());
	char buf[4];
	for (idx_t i = begin; i < end; i++) {
		int size = 0;
		if (!Utf8Proc::CodepointToUtf8(duckdb::utf8proc_tolower(codepoints[i]), size, buf)) {
			throw duckdb::InternalException("Could not encode lower-cased codepoint " + std::to_string(codepoints[i]));
		}
		folded.append(buf, static_cast<size_t>(size));
	}
	return folded;
}

double RoundNormalized(double value) {
	if (!std::isfinite(value)) {
		return value;
	}
	// rounds the exact binary value: 1.234565 is stored slightly below and must give 1.23456
	char buf[400];
	snprintf(buf, sizeof(buf), "%.*f", NORMALIZE_DECIMAL_DIGITS, value);
	return std::strtod(buf, nullptr);
}

static double ParseDecimal(const string &digits) {
	string trimmed = digits;
	StringUtil::Trim(trimmed);
	char *end = nullptr;
	double result = std::strtod(trimmed.c_str(), &end);
	if (trimmed.empty() || end == trimmed.c_str() || *end != '\0') {
		throw duckdb::InvalidInputException("Malformed decimal value: '" + digits + "'");
	}
	return result;
}

NormalizedValue NormalizeValue(const RawValue &value) {
	switch (value.Type()) {
	case RawValueType::TEXT: {
		string text = FoldText(value.GetText());
		if (IsTrueToken(text)) {
			return NormalizeValue(RawValue::Integer(1));
		}
		if (IsFalseToken(text)) {
			return NormalizeValue(RawValue::Integer(0));
		}
		return NormalizedValue::Text(std::move(text));
	}
	case RawValueType::BOOLEAN:
		return NormalizeValue(RawValue::Integer(value.GetBoolean() ? 1 : 0));
	case RawValueType::INTEGER:
		return NormalizedValue::Number(RoundNormalized(static_cast<double>(value.GetInteger())));
	case RawValueType::FLOAT:
		return NormalizedValue::Number(RoundNormalized(value.GetFloat()));
	case RawValueType::DECIMAL:
		return NormalizedValue::Number(RoundNormalized(ParseDecimal(value.GetDecimal())));
	case RawValueType::NULL_VALUE:
		return NormalizedValue::Null();
	case RawValueType::OTHER:
		return NormalizedValue::Other(value.GetTypeName(), value.GetRendering());
	}
	throw duckdb::InternalException("Unhandled raw value type in NormalizeValue");
}

RawValue ToRawValue(const NormalizedValue &value) {
	switch (value.Type()) {
	case NormalizedType::NULL_VALUE:
		return RawValue::Null();
	case NormalizedType::NUMBER:
		return RawValue::Float(value.GetNumber());
	case NormalizedType::TEXT:
		return RawValue::Text(value.GetText());
	case NormalizedType::OTHER:
		return RawValue::Other(value.GetTypeName(), value.GetText());
	}
	throw duckdb::InternalException("Unhandled normalized value type in ToRawValue");
}

NormalizedRow NormalizeRow(const Row &row) {
	NormalizedRow result;
	result.reserve(row.size());
	for (auto &value : row) {
		result.push_back(NormalizeValue(value));
	}
	return result;
}

NormalizedResultSet NormalizeResultSet(const vector<Row> &rows) {
	NormalizedResultSet result;
	result.reserve(rows.size());
	for (auto &row : rows) {
		result.insert(NormalizeRow(row));
	}
	return result;
}

NormalizedResultSet NormalizeResultSet(const NormalizedResultSet &rows) {
	NormalizedResultSet result;
	result.reserve(rows.size());
	for (auto &row : rows) {
		Row raw;
		raw.reserve(row.size());
		for (auto &value : row) {
			raw.push_back(ToRawValue(value));
		}
		result.insert(NormalizeRow(raw));
	}
	return result;
}

} // namespace sqlacc
