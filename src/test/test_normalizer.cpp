//
// Test value, row and result-set normalization
//
#include <catch2/catch.hpp>

#include "include/test_helpers.hpp"

#include <limits>

using namespace sqlacc;

TEST_CASE("Text is trimmed and lower-cased", "[normalizer]") {
	REQUIRE(NormalizeValue(Txt("  Hello World \t")) == NormalizedValue::Text("hello world"));
	REQUIRE(NormalizeValue(Txt("ALICE")) == NormalizeValue(Txt("alice")));
	REQUIRE(NormalizeValue(Txt("")) == NormalizedValue::Text(""));
}

TEST_CASE("Non-ASCII text is folded per codepoint", "[normalizer]") {
	// "ÉCOLE" vs " école "
	REQUIRE(NormalizeValue(Txt("\xC3\x89" "COLE")) == NormalizeValue(Txt(" \xC3\xA9" "cole ")));
	REQUIRE(NormalizeValue(Txt("\xC3\x89" "COLE")) == NormalizedValue::Text("\xC3\xA9" "cole"));
	// " Zoë " with a no-break space and an ideographic space around it
	REQUIRE(FoldText("\xC2\xA0Zo\xC3\xAB\xE3\x80\x80") == "zo\xC3\xAB");
	REQUIRE(FoldText("\xCE\xA3\xCE\x9F\xCE\xA6\xCE\x99\xCE\x91") == "\xCF\x83\xCE\xBF\xCF\x86\xCE\xB9\xCE\xB1");
	REQUIRE(FoldText("\x1c TRUE \x1f") == "true");
	REQUIRE(NormalizeValue(Txt("\xE2\x80\x83Yes\xE2\x80\xA8")) == NormalizedValue::Number(1.0));
	// zero-width space is not whitespace
	REQUIRE(FoldText("\xE2\x80\x8B" "A") == "\xE2\x80\x8B" "a");
	// invalid UTF-8 still folds ASCII letters
	REQUIRE(FoldText(" AB\xFF ") == "ab\xFF");
}

TEST_CASE("Boolean tokens map to 1 and 0", "[normalizer]") {
	auto one = NormalizedValue::Number(1.0);
	auto zero = NormalizedValue::Number(0.0);

	REQUIRE(NormalizeValue(Txt("TRUE")) == one);
	REQUIRE(NormalizeValue(Txt("Yes")) == one);
	REQUIRE(NormalizeValue(Txt(" 1 ")) == one);
	REQUIRE(NormalizeValue(Int(1)) == one);
	REQUIRE(NormalizeValue(RawValue::Boolean(true)) == one);

	REQUIRE(NormalizeValue(Txt("false")) == zero);
	REQUIRE(NormalizeValue(Txt(" No")) == zero);
	REQUIRE(NormalizeValue(Txt("0")) == zero);
	REQUIRE(NormalizeValue(RawValue::Boolean(false)) == zero);

	// only the exact tokens are converted
	REQUIRE(NormalizeValue(Txt("2")) == NormalizedValue::Text("2"));
	REQUIRE(NormalizeValue(Txt("2")) != NormalizeValue(Int(2)));
	REQUIRE(NormalizeValue(Txt("1.0")) == NormalizedValue::Text("1.0"));
	REQUIRE(NormalizeValue(Txt("y")) == NormalizedValue::Text("y"));
}

TEST_CASE("Numbers are rounded to 5 decimals", "[normalizer]") {
	REQUIRE(NormalizeValue(Flt(1.000001)) == NormalizeValue(Flt(1.0)));
	REQUIRE(NormalizeValue(Flt(1.00001)) != NormalizeValue(Flt(1.0)));
	REQUIRE(NormalizeValue(Flt(0.123456789)).GetNumber() == 0.12346);
	REQUIRE(NormalizeValue(Int(42)) == NormalizeValue(Flt(42.0)));
	REQUIRE(NormalizeValue(Int(42)).GetNumber() == 42.0);

	// correctly rounded on the stored binary value
	REQUIRE(RoundNormalized(1.234565) == 1.23456);
	REQUIRE(RoundNormalized(0.000015) == 0.00002);
	REQUIRE(RoundNormalized(-2.5) == -2.5);
}

TEST_CASE("Decimals normalize like the equivalent float", "[normalizer]") {
	REQUIRE(NormalizeValue(Dec("1.234565")) == NormalizeValue(Flt(1.234565)));
	REQUIRE(NormalizeValue(Dec("12.340000")) == NormalizeValue(Flt(12.34)));
	REQUIRE(NormalizeValue(Dec("100")) == NormalizeValue(Int(100)));
	REQUIRE(NormalizeValue(Dec("-0.5")) == NormalizeValue(Flt(-0.5)));
	REQUIRE(NormalizeValue(Dec("123456789012345678901234567890")).GetNumber() == 1.2345678901234568e29);
	REQUIRE_THROWS_AS(NormalizeValue(Dec("12,5")), duckdb::InvalidInputException);
}

TEST_CASE("Negative zero equals zero", "[normalizer]") {
	auto negative = NormalizeValue(Flt(-0.0));
	auto tiny_negative = NormalizeValue(Flt(-0.000001));
	auto zero = NormalizeValue(Int(0));
	REQUIRE(negative == zero);
	REQUIRE(tiny_negative == zero);
	REQUIRE(negative.Hash() == zero.Hash());
	REQUIRE(tiny_negative.Hash() == zero.Hash());
}

TEST_CASE("NULL and opaque values are kept as they are", "[normalizer]") {
	REQUIRE(NormalizeValue(RawValue::Null()) == NormalizedValue::Null());
	auto date = NormalizeValue(RawValue::Other("DATE", "2020-01-02"));
	REQUIRE(date == NormalizedValue::Other("DATE", "2020-01-02"));
	REQUIRE(date != NormalizedValue::Text("2020-01-02"));
	REQUIRE(date != NormalizeValue(RawValue::Other("VARCHAR[]", "2020-01-02")));
	REQUIRE(NormalizedValue::Null() != NormalizedValue::Text("null"));
}

TEST_CASE("Normalization is idempotent", "[normalizer]") {
	vector<RawValue> samples = {Txt("  MiXeD "),
	                            Txt("YES"),
	                            Txt("no"),
	                            Txt("2"),
	                            Int(-17),
	                            Int(1),
	                            Flt(3.14159265),
	                            Flt(-0.0),
	                            Flt(std::numeric_limits<double>::infinity()),
	                            Flt(1e300),
	                            Dec("99.999995"),
	                            RawValue::Boolean(true),
	                            RawValue::Null(),
	                            RawValue::Other("TIMESTAMP", "2021-11-01 00:00:00")};
	for (auto &sample : samples) {
		auto once = NormalizeValue(sample);
		auto twice = NormalizeValue(ToRawValue(once));
		INFO("value " << sample.ToString());
		REQUIRE(twice == once);
		REQUIRE(twice.Hash() == once.Hash());
	}
}

TEST_CASE("Rows keep column order and count", "[normalizer]") {
	auto row = NormalizeRow({Int(5), Txt(" A "), RawValue::Null(), Int(5)});
	REQUIRE(row.size() == 4);
	REQUIRE(row[0] == NormalizedValue::Number(5));
	REQUIRE(row[1] == NormalizedValue::Text("a"));
	REQUIRE(row[2] == NormalizedValue::Null());
	REQUIRE(row[3] == NormalizedValue::Number(5));

	REQUIRE(NormalizeRow({Int(1), Txt("a")}) != NormalizeRow({Txt("a"), Int(1)}));
	REQUIRE(NormalizeRow({}).empty());
}

TEST_CASE("Result sets drop duplicates after normalization", "[normalizer]") {
	auto set = NormalizeResultSet(vector<Row> {{Int(1), Txt("A")}, {Int(1), Txt("a")}});
	REQUIRE(set.size() == 1);
	REQUIRE(set.count(NormalizedRow {NormalizedValue::Number(1), NormalizedValue::Text("a")}) == 1);

	auto distinct = NormalizeResultSet(vector<Row> {{Int(1), Txt("a")}, {Int(2), Txt("a")}, {Txt("a"), Int(1)}});
	REQUIRE(distinct.size() == 3);

	auto booleans = NormalizeResultSet(vector<Row> {{RawValue::Boolean(true)}, {Txt("yes")}, {Flt(1.0000001)}});
	REQUIRE(booleans.size() == 1);

	REQUIRE(NormalizeResultSet(vector<Row> {}).empty());
}

TEST_CASE("Result set normalization is idempotent", "[normalizer]") {
	auto once = NormalizeResultSet(
	    vector<Row> {{Int(1), Txt("Alice"), Dec("10.500")}, {Int(2), Txt("BOB"), RawValue::Null()}, {Int(1), Txt("alice"), Flt(10.5)}});
	REQUIRE(once.size() == 2);
	auto twice = NormalizeResultSet(once);
	REQUIRE(twice == once);
}
