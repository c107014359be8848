//
// Test result-set equivalence
//
#include <catch2/catch.hpp>

#include "include/test_helpers.hpp"
#include "sqlacc_comparator.hpp"

using namespace sqlacc;

static NormalizedResultSet Set(const vector<Row> &rows) {
	return NormalizeResultSet(rows);
}

TEST_CASE("Value sets ignore order and duplicates", "[comparator]") {
	auto five_a = ValueSetOf(NormalizeRow({Int(5), Txt("a")}));
	auto a_five = ValueSetOf(NormalizeRow({Txt("a"), Int(5)}));
	REQUIRE(five_a == a_five);
	REQUIRE(ValueSetOf(NormalizeRow({Int(5), Int(5)})).size() == 1);

	REQUIRE(IsSubset(ValueSetOf(NormalizeRow({Int(5)})), five_a));
	REQUIRE_FALSE(IsSubset(five_a, ValueSetOf(NormalizeRow({Int(5)}))));
	REQUIRE(IsSubset(ValueSet(), five_a));
	REQUIRE(IsSubset(ValueSet(), ValueSet()));
}

TEST_CASE("Identical sets are equivalent", "[comparator]") {
	auto actual = Set({{Int(1), Txt("alice")}, {Int(2), Txt("bob")}});
	REQUIRE(IsEquivalent(actual, actual));
	// normalization makes these equal as well
	REQUIRE(IsEquivalent(actual, Set({{Flt(2.0000001), Txt("BOB ")}, {Dec("1.000"), Txt("Alice")}})));
}

TEST_CASE("Extra or missing columns are tolerated", "[comparator]") {
	auto actual = Set({{Int(1)}, {Int(2)}});
	REQUIRE(IsEquivalent(actual, Set({{Int(1), Txt("alice")}, {Int(2), Txt("bob")}})));

	auto wide = Set({{Int(1), Txt("alice"), Flt(3.5)}});
	REQUIRE(IsEquivalent(wide, Set({{Txt("alice")}})));
}

TEST_CASE("Column order does not matter", "[comparator]") {
	REQUIRE(IsEquivalent(Set({{Int(5), Txt("a")}}), Set({{Txt("a"), Int(5)}})));
	REQUIRE(IsEquivalent(Set({{Int(5), Int(5)}}), Set({{Int(5)}})));
}

TEST_CASE("Different values are not equivalent", "[comparator]") {
	REQUIRE_FALSE(IsEquivalent(Set({{Int(1)}}), Set({{Int(2)}})));
	REQUIRE_FALSE(IsEquivalent(Set({{Int(1), Int(2)}}), Set({{Int(3), Int(4)}})));
	REQUIRE_FALSE(IsEquivalent(Set({{Int(1), Txt("a")}}), Set({{Int(1), Txt("b")}})));
	REQUIRE_FALSE(IsEquivalent(Set({{Txt("2")}}), Set({{Int(2)}})));
	REQUIRE_FALSE(IsEquivalent(Set({{RawValue::Null()}}), Set({{Int(0)}})));
}

TEST_CASE("The matched count is held against the actual row count", "[comparator]") {
	auto actual = Set({{Int(1)}, {Int(2)}});

	// every predicted row matches but there are more of them than actual rows
	REQUIRE_FALSE(IsEquivalent(actual, Set({{Int(1), Txt("x")}, {Int(2), Txt("y")}, {Int(1), Txt("z")}})));

	// same number of rows with a coincidental match on the first column
	REQUIRE(IsEquivalent(actual, Set({{Int(1), Txt("x")}, {Int(2), Txt("y")}})));

	// every predicted row matches but some actual rows were never returned
	REQUIRE_FALSE(IsEquivalent(Set({{Int(1)}, {Int(2)}, {Int(3)}}), Set({{Int(1)}, {Int(2)}})));

	// two predicted rows both matching the same actual row still count twice
	REQUIRE(IsEquivalent(Set({{Int(1), Txt("a")}, {Int(9), Txt("z")}}), Set({{Int(1)}, {Txt("a")}})));
}

TEST_CASE("Empty result sets", "[comparator]") {
	NormalizedResultSet empty;
	REQUIRE(IsEquivalent(empty, empty));
	REQUIRE_FALSE(IsEquivalent(empty, Set({{Int(1)}})));
	REQUIRE_FALSE(IsEquivalent(Set({{Int(1)}}), empty));
}

TEST_CASE("An empty row matches any row", "[comparator]") {
	NormalizedResultSet empty_row;
	empty_row.insert(NormalizedRow());
	REQUIRE(IsEquivalent(Set({{Int(7)}}), empty_row));
	REQUIRE(IsEquivalent(empty_row, Set({{Int(7)}})));
}

TEST_CASE("NULL cells take part in matching", "[comparator]") {
	auto actual = Set({{Int(1), RawValue::Null()}});
	REQUIRE(IsEquivalent(actual, Set({{RawValue::Null()}})));
	REQUIRE(IsEquivalent(actual, Set({{RawValue::Null(), Int(1)}})));
	REQUIRE_FALSE(IsEquivalent(actual, Set({{Txt("null")}})));
}
