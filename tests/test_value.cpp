/**
 * @file test_value.cpp
 * @brief Tests for the value model and canonical encoding
 */

#include <gtest/gtest.h>
#include "ndiff/Value.hpp"

#include <cstdint>
#include <limits>
#include <vector>

using namespace ndiff;

// ============================================================================
// Type helpers
// ============================================================================

TEST(ValueType, Names) {
    EXPECT_EQ(type_name(Value()), "null");
    EXPECT_EQ(type_name(Value(true)), "boolean");
    EXPECT_EQ(type_name(Value(3)), "integer");
    EXPECT_EQ(type_name(Value(3u)), "integer");
    EXPECT_EQ(type_name(Value(2.5)), "float");
    EXPECT_EQ(type_name(Value("x")), "string");
    EXPECT_EQ(type_name(Value::array()), "sequence");
    EXPECT_EQ(type_name(Value::object()), "mapping");
}

TEST(ValueType, IsContainer) {
    EXPECT_TRUE(is_container(Value::array()));
    EXPECT_TRUE(is_container(Value::object()));
    EXPECT_FALSE(is_container(Value("[]")));
    EXPECT_FALSE(is_container(Value()));
}

// ============================================================================
// Deep equality
// ============================================================================

TEST(DeepEqual, MappingsIgnoreInsertionOrder) {
    Value a = Value::object();
    a["x"] = 1;
    a["y"] = 2;
    Value b = Value::object();
    b["y"] = 2;
    b["x"] = 1;
    EXPECT_TRUE(deep_equal(a, b));
}

TEST(DeepEqual, SequencesArePositional) {
    EXPECT_FALSE(deep_equal(Value{1, 2}, Value{2, 1}));
    EXPECT_TRUE(deep_equal(Value{1, Value{{"a", 1}}}, Value{1, Value{{"a", 1}}}));
}

TEST(DeepEqual, NumbersCompareByValue) {
    EXPECT_TRUE(deep_equal(Value(1), Value(1.0)));
    EXPECT_TRUE(deep_equal(Value(1), Value(1u)));
    EXPECT_FALSE(deep_equal(Value(1), Value(true)));
    EXPECT_FALSE(deep_equal(Value(1), Value("1")));
}

// ============================================================================
// Canonical encoding
// ============================================================================

TEST(CanonicalEncoding, Deterministic) {
    Value v = Value::parse(R"({"b": [1, {"c": null}], "a": "x"})");
    EXPECT_EQ(canonical_encoding(v), canonical_encoding(v));
    EXPECT_EQ(canonical_encoding(v), canonical_encoding(Value(v)));
}

TEST(CanonicalEncoding, IntegralFloatsMatchIntegers) {
    EXPECT_EQ(canonical_encoding(Value(1)), canonical_encoding(Value(1.0)));
    EXPECT_EQ(canonical_encoding(Value(-7)), canonical_encoding(Value(-7.0)));
    EXPECT_EQ(canonical_encoding(Value(5u)), canonical_encoding(Value(5)));
    EXPECT_EQ(canonical_encoding(Value(0)), canonical_encoding(Value(-0.0)));
}

TEST(CanonicalEncoding, FractionalFloatsStayDistinct) {
    EXPECT_NE(canonical_encoding(Value(1.5)), canonical_encoding(Value(1)));
    EXPECT_NE(canonical_encoding(Value(0.1)), canonical_encoding(Value(0.2)));
}

TEST(CanonicalEncoding, StringsAreLengthPrefixed) {
    EXPECT_NE(canonical_encoding(Value{"ab", "c"}), canonical_encoding(Value{"a", "bc"}));
    EXPECT_NE(canonical_encoding(Value("")), canonical_encoding(Value()));
}

TEST(CanonicalEncoding, AgreesWithDeepEqual) {
    std::vector<Value> samples = {
        Value(),
        Value(true),
        Value(false),
        Value(0),
        Value(0.0),
        Value(-0.0),
        Value(1),
        Value(1u),
        Value(1.0),
        Value(1.5),
        Value("1"),
        Value(""),
        Value::array(),
        Value::object(),
        Value{1, 2},
        Value{1.0, 2},
        Value{2, 1},
        Value{{"a", 1}},
        Value{{"a", 1.0}},
        Value{{"a", Value{1}}},
        Value::parse("[[1]]"),
        Value{"ab", "c"},
        Value{"a", "bc"},
        Value::parse(R"({"k": [1, {"z": null}]})"),
        Value::parse(R"({"k": [1, {"z": false}]})"),
    };

    for (const auto& x : samples) {
        for (const auto& y : samples) {
            EXPECT_EQ(deep_equal(x, y), canonical_encoding(x) == canonical_encoding(y))
                << x.dump() << " vs " << y.dump();
        }
    }
}

TEST(CanonicalEncoding, NumericExceptions) {
    const Value nan1(std::numeric_limits<double>::quiet_NaN());
    const Value nan2(std::numeric_limits<double>::quiet_NaN());
    EXPECT_FALSE(deep_equal(nan1, nan2));
    EXPECT_EQ(canonical_encoding(nan1), canonical_encoding(nan2));

    // 2^53 + 1 rounds to 2^53 as a double
    const Value big(std::int64_t{9007199254740993});
    const Value rounded(9007199254740992.0);
    EXPECT_TRUE(deep_equal(big, rounded));
    EXPECT_NE(canonical_encoding(big), canonical_encoding(rounded));
}
