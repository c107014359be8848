//
// Cell values as produced by a query executor, and their normalized comparable form.
//

#ifndef SQLACC_VALUE_HPP
#define SQLACC_VALUE_HPP

#include "duckdb.hpp"
#include "duckdb/common/types/hash.hpp"

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace sqlacc {

using duckdb::hash_t;
using duckdb::idx_t;
using std::string;
using std::vector;

enum class RawValueType : uint8_t { TEXT, INTEGER, FLOAT, DECIMAL, BOOLEAN, NULL_VALUE, OTHER };

// A single cell as returned by a query executor.
// DECIMAL keeps the exact decimal text (e.g. "12.3400"); OTHER keeps the source type name and its rendering.
class RawValue {
public:
	RawValue() : type(RawValueType::NULL_VALUE), integer_value(0), float_value(0), boolean_value(false) {
	}

	static RawValue Text(string text);
	static RawValue Integer(int64_t value);
	static RawValue Float(double value);
	static RawValue Decimal(string digits);
	static RawValue Boolean(bool value);
	static RawValue Null();
	static RawValue Other(string type_name, string rendering);

	RawValueType Type() const {
		return type;
	}
	bool IsNull() const {
		return type == RawValueType::NULL_VALUE;
	}

	const string &GetText() const;
	int64_t GetInteger() const;
	double GetFloat() const;
	const string &GetDecimal() const;
	bool GetBoolean() const;
	const string &GetTypeName() const;
	const string &GetRendering() const;

	string ToString() const;

private:
	RawValueType type;
	int64_t integer_value;
	double float_value;
	bool boolean_value;
	// text for TEXT, digits for DECIMAL, rendering for OTHER
	string text_value;
	string type_name;
};

using Row = vector<RawValue>;

enum class NormalizedType : uint8_t { NULL_VALUE, NUMBER, TEXT, OTHER };

// Canonical form of a cell: case-folded text, numbers rounded to 5 decimals, NULL, or an opaque value
// compared by (type name, rendering).
class NormalizedValue {
public:
	NormalizedValue() : type(NormalizedType::NULL_VALUE), number(0) {
	}

	static NormalizedValue Null();
	static NormalizedValue Number(double value);
	static NormalizedValue Text(string text);
	static NormalizedValue Other(string type_name, string rendering);

	NormalizedType Type() const {
		return type;
	}
	double GetNumber() const;
	const string &GetText() const;
	const string &GetTypeName() const;

	bool operator==(const NormalizedValue &other) const;
	bool operator!=(const NormalizedValue &other) const {
		return !(*this == other);
	}

	hash_t Hash() const;
	string ToString() const;

private:
	NormalizedType type;
	double number;
	// text for TEXT, rendering for OTHER
	string text;
	string type_name;
};

struct NormalizedValueHash {
	size_t operator()(const NormalizedValue &value) const {
		return static_cast<size_t>(value.Hash());
	}
};

using NormalizedRow = vector<NormalizedValue>;

struct NormalizedRowHash {
	size_t operator()(const NormalizedRow &row) const;
};

using NormalizedResultSet = std::unordered_set<NormalizedRow, NormalizedRowHash>;

// Unordered, deduplicated values of one row; column position is not kept.
using ValueSet = std::unordered_set<NormalizedValue, NormalizedValueHash>;

string RowToString(const NormalizedRow &row);

} // namespace sqlacc

#endif // SQLACC_VALUE_HPP
