/**
 * @file test_diffnode.cpp
 * @brief Tests for diff node helpers and structure validation
 */

#include <gtest/gtest.h>
#include "ndiff/DiffNode.hpp"
#include "ndiff/Errors.hpp"

using namespace ndiff;

namespace {
Value J(const char* text) {
    return Value::parse(text);
}
}

// ============================================================================
// Builders and queries
// ============================================================================

TEST(DiffNode, MakeNode) {
    EXPECT_EQ(make_node(key::A, 2), J(R"({"A": 2})"));
    EXPECT_EQ(make_node(key::R, Value()), J(R"({"R": null})"));
    EXPECT_EQ(make_node(key::D, Value::array()), J(R"({"D": []})"));
}

TEST(DiffNode, EmptyNode) {
    EXPECT_TRUE(is_empty_node(empty_node()));
    EXPECT_FALSE(is_empty_node(J(R"({"U": 1})")));
    EXPECT_FALSE(is_empty_node(Value::array()));
    EXPECT_FALSE(is_empty_node(Value()));
}

TEST(DiffNode, HasOp) {
    Value node = J(R"({"N": 4, "I": 3})");
    EXPECT_TRUE(has_op(node, key::N));
    EXPECT_TRUE(has_op(node, key::I));
    EXPECT_FALSE(has_op(node, key::O));
    EXPECT_FALSE(has_op(Value("N"), key::N));
}

TEST(DiffNode, PointerAppend) {
    EXPECT_EQ(pointer_append("", "a"), "/a");
    EXPECT_EQ(pointer_append("/a", std::size_t{3}), "/a/3");
    EXPECT_EQ(pointer_append("", "x/y~z"), "/x~1y~0z");
}

// ============================================================================
// Validation
// ============================================================================

TEST(ValidateDiff, AcceptsWellFormedTrees) {
    EXPECT_NO_THROW(validate_diff(empty_node()));
    EXPECT_NO_THROW(validate_diff(J(R"({"U": [1, 2]})")));
    EXPECT_NO_THROW(validate_diff(J(R"({"N": 1, "O": 2})")));
    EXPECT_NO_THROW(validate_diff(
        J(R"({"D": {"one": {"D": [{"I": 1, "R": 7}]}, "two": {"A": 2}}})")));
    EXPECT_NO_THROW(validate_diff(J(R"({"D": [{"R": 0}, {"N": 4, "I": 3}, {"A": 5}]})")));
}

TEST(ValidateDiff, RejectsNonMappingNode) {
    EXPECT_THROW(validate_diff(J("[1, 2]")), InvalidDiffStructure);
    EXPECT_THROW(validate_diff(J(R"({"D": [1]})")), InvalidDiffStructure);
}

TEST(ValidateDiff, RejectsUnknownKeys) {
    EXPECT_THROW(validate_diff(J(R"({"X": 1})")), InvalidDiffStructure);
    EXPECT_THROW(validate_diff(J(R"({"D": {"a": {"AA": 1}}})")), InvalidDiffStructure);
}

TEST(ValidateDiff, RejectsScalarDeepPayload) {
    try {
        validate_diff(J(R"({"D": {"a": {"D": 5}}})"));
        FAIL() << "Expected InvalidDiffStructure";
    } catch (const InvalidDiffStructure& e) {
        EXPECT_EQ(e.path(), "/a");
        EXPECT_NE(std::string(e.what()).find("'D'"), std::string::npos);
    }
}

TEST(ValidateDiff, IndexRules) {
    EXPECT_THROW(validate_diff(J(R"({"I": 1, "N": 2})")), InvalidDiffStructure);
    EXPECT_THROW(validate_diff(J(R"({"D": {"k": {"I": 0, "A": 1}}})")), InvalidDiffStructure);
    EXPECT_THROW(validate_diff(J(R"({"D": [{"I": -1, "R": 1}]})")), InvalidDiffStructure);
    EXPECT_THROW(validate_diff(J(R"({"D": [{"I": 1.5, "R": 1}]})")), InvalidDiffStructure);
    EXPECT_THROW(validate_diff(J(R"({"D": [{"I": "1", "R": 1}]})")), InvalidDiffStructure);
    EXPECT_THROW(validate_diff(J(R"({"D": [{"I": 9223372036854775808, "R": 1}]})")), InvalidDiffStructure);
    EXPECT_NO_THROW(validate_diff(J(R"({"D": [{"I": 9223372036854775807, "R": 1}]})")));
}

// ============================================================================
// Statistics
// ============================================================================

TEST(CountOps, CountsLeafOpsRecursively) {
    Value node = J(R"({"D": {
        "a": {"D": [{"U": 1}, {"R": 2}, {"A": 3}, {"N": 4, "O": 5}]},
        "b": {"A": {"x": 1}},
        "c": {"U": "same"},
        "d": {"O": false}
    }})");

    DiffStats s = count_ops(node);
    EXPECT_EQ(s.added, 2u);
    EXPECT_EQ(s.removed, 1u);
    EXPECT_EQ(s.changed, 2u);
    EXPECT_EQ(s.unchanged, 2u);
    EXPECT_TRUE(s.has_changes());
}

TEST(CountOps, UnchangedOnly) {
    DiffStats s = count_ops(J(R"({"U": {"a": 1}})"));
    EXPECT_EQ(s.unchanged, 1u);
    EXPECT_FALSE(s.has_changes());
    EXPECT_FALSE(count_ops(empty_node()).has_changes());
}
