#include "sqlacc_value.hpp"

#include "duckdb/common/exception.hpp"

#include <sstream>

namespace sqlacc {

// ============================================================================
// RawValue
// ============================================================================

RawValue RawValue::Text(string text) {
	RawValue result;
	result.type = RawValueType::TEXT;
	result.text_value = std::move(text);
	return result;
}

RawValue RawValue::Integer(int64_t value) {
	RawValue result;
	result.type = RawValueType::INTEGER;
	result.integer_value = value;
	return result;
}

RawValue RawValue::Float(double value) {
	RawValue result;
	result.type = RawValueType::FLOAT;
	result.float_value = value;
	return result;
}

RawValue RawValue::Decimal(string digits) {
	RawValue result;
	result.type = RawValueType::DECIMAL;
	result.text_value = std::move(digits);
	return result;
}

RawValue RawValue::Boolean(bool value) {
	RawValue result;
	result.type = RawValueType::BOOLEAN;
	result.boolean_value = value;
	return result;
}

RawValue RawValue::Null() {
	return RawValue();
}

RawValue RawValue::Other(string type_name, string rendering) {
	RawValue result;
	result.type = RawValueType::OTHER;
	result.type_name = std::move(type_name);
	result.text_value = std::move(rendering);
	return result;
}

const string &RawValue::GetText() const {
	if (type != RawValueType::TEXT) {
		throw duckdb::InternalException("RawValue::GetText called on a non-text value");
	}
	return text_value;
}

int64_t RawValue::GetInteger() const {
	if (type != RawValueType::INTEGER) {
		throw duckdb::InternalException("RawValue::GetInteger called on a non-integer value");
	}
	return integer_value;
}

double RawValue::GetFloat() const {
	if (type != RawValueType::FLOAT) {
		throw duckdb::InternalException("RawValue::GetFloat called on a non-float value");
	}
	return float_value;
}

const string &RawValue::GetDecimal() const {
	if (type != RawValueType::DECIMAL) {
		throw duckdb::InternalException("RawValue::GetDecimal called on a non-decimal value");
	}
	return text_value;
}

bool RawValue::GetBoolean() const {
	if (type != RawValueType::BOOLEAN) {
		throw duckdb::InternalException("RawValue::GetBoolean called on a non-boolean value");
	}
	return boolean_value;
}

const string &RawValue::GetTypeName() const {
	if (type != RawValueType::OTHER) {
		throw duckdb::InternalException("RawValue::GetTypeName called on a non-opaque value");
	}
	return type_name;
}

const string &RawValue::GetRendering() const {
	if (type != RawValueType::OTHER) {
		throw duckdb::InternalException("RawValue::GetRendering called on a non-opaque value");
	}
	return text_value;
}

string RawValue::ToString() const {
	switch (type) {
	case RawValueType::TEXT:
		return "'" + text_value + "'";
	case RawValueType::INTEGER:
		return std::to_string(integer_value);
	case RawValueType::FLOAT: {
		std::ostringstream oss;
		oss << float_value;
		return oss.str();
	}
	case RawValueType::DECIMAL:
		return text_value;
	case RawValueType::BOOLEAN:
		return boolean_value ? "true" : "false";
	case RawValueType::NULL_VALUE:
		return "NULL";
	case RawValueType::OTHER:
		return type_name + "(" + text_value + ")";
	}
	return string();
}

// ============================================================================
// NormalizedValue
// ============================================================================

NormalizedValue NormalizedValue::Null() {
	return NormalizedValue();
}

NormalizedValue NormalizedValue::Number(double value) {
	NormalizedValue result;
	result.type = NormalizedType::NUMBER;
	// folds -0.0 into 0.0 so both hash the same
	result.number = value + 0.0;
	return result;
}

NormalizedValue NormalizedValue::Text(string text) {
	NormalizedValue result;
	result.type = NormalizedType::TEXT;
	result.text = std::move(text);
	return result;
}

NormalizedValue NormalizedValue::Other(string type_name, string rendering) {
	NormalizedValue result;
	result.type = NormalizedType::OTHER;
	result.type_name = std::move(type_name);
	result.text = std::move(rendering);
	return result;
}

double NormalizedValue::GetNumber() const {
	if (type != NormalizedType::NUMBER) {
		throw duckdb::InternalException("NormalizedValue::GetNumber called on a non-numeric value");
	}
	return number;
}

const string &NormalizedValue::GetText() const {
	if (type != NormalizedType::TEXT && type != NormalizedType::OTHER) {
		throw duckdb::InternalException("NormalizedValue::GetText called on a value without text");
	}
	return text;
}

const string &NormalizedValue::GetTypeName() const {
	if (type != NormalizedType::OTHER) {
		throw duckdb::InternalException("NormalizedValue::GetTypeName called on a non-opaque value");
	}
	return type_name;
}

bool NormalizedValue::operator==(const NormalizedValue &other) const {
	if (type != other.type) {
		return false;
	}
	switch (type) {
	case NormalizedType::NULL_VALUE:
		return true;
	case NormalizedType::NUMBER:
		return number == other.number;
	case NormalizedType::TEXT:
		return text == other.text;
	case NormalizedType::OTHER:
		return type_name == other.type_name && text == other.text;
	}
	return false;
}

hash_t NormalizedValue::Hash() const {
	hash_t tag_hash = duckdb::Hash<uint8_t>(static_cast<uint8_t>(type));
	switch (type) {
	case NormalizedType::NULL_VALUE:
		return tag_hash;
	case NormalizedType::NUMBER:
		return duckdb::CombineHash(tag_hash, duckdb::Hash<double>(number));
	case NormalizedType::TEXT:
		return duckdb::CombineHash(tag_hash, duckdb::Hash(text.c_str(), text.size()));
	case NormalizedType::OTHER: {
		auto name_hash = duckdb::Hash(type_name.c_str(), type_name.size());
		return duckdb::CombineHash(duckdb::CombineHash(tag_hash, name_hash), duckdb::Hash(text.c_str(), text.size()));
	}
	}
	return tag_hash;
}

string NormalizedValue::ToString() const {
	switch (type) {
	case NormalizedType::NULL_VALUE:
		return "NULL";
	case NormalizedType::NUMBER: {
		std::ostringstream oss;
		oss.precision(17);
		oss << number;
		return oss.str();
	}
	case NormalizedType::TEXT:
		return "'" + text + "'";
	case NormalizedType::OTHER:
		return type_name + "(" + text + ")";
	}
	return string();
}

size_t NormalizedRowHash::operator()(const NormalizedRow &row) const {
	// seeded with the width so () and (NULL) differ
	hash_t result = duckdb::Hash<uint64_t>(row.size());
	for (auto &value : row) {
		result = duckdb::CombineHash(result, value.Hash());
	}
	return static_cast<size_t>(result);
}

string RowToString(const NormalizedRow &row) {
	string out = "(";
	for (idx_t i = 0; i < row.size(); i++) {
		if (i > 0) {
			out += ", ";
		}
		out += row[i].ToString();
	}
	out += ")";
	return out;
}

} // namespace sqlacc
