/**
 * @file test_assertion.cpp
 * @brief Unit tests for the fluent assertion front end (GoogleTest)
 *
 * Covers:
 * - Chaining and path lists (empty list = root)
 * - Absent expected/actual values
 * - End-to-end matching scenarios
 * - Convenience entry points
 */

#include <gtest/gtest.h>
#include "jsonexpect/Assertion.hpp"
#include "jsonexpect/Convert.hpp"

using namespace jsonexpect;

// ============================================================================
// Builder
// ============================================================================

TEST(JsonAssertion, DefaultsAreSubsetExactMatch) {
    EXPECT_TRUE(assert_json(Value({{"a", 1}}), Value({{"a", 1}, {"b", 2}})).check());
    EXPECT_FALSE(assert_json(Value({{"a", 1}}), Value({{"a", 2}})).check());
}

TEST(JsonAssertion, ChainingRecordsEveryOption) {
    auto assertion = assert_json(Value::object(), Value::object())
        .any_order({"items[*]"})
        .type_match({"items[*].ts"})
        .equal_count({"items"})
        .element_count(3, {"items"})
        .key_must_be_absent({"debug"});

    const NodeConfig& config = assertion.config();
    ResolvedNode items = ResolvedNode::root(config).resolved_child("items");
    EXPECT_TRUE(items.is_equal_count());
    ASSERT_TRUE(items.element_count().has_value());
    EXPECT_EQ(*items.element_count(), 3u);
    EXPECT_TRUE(items.resolved_child(4).is_any_order());
    EXPECT_FALSE(items.resolved_child(4).resolved_child("ts").is_exact_match());
    EXPECT_TRUE(ResolvedNode::root(config).resolved_child("debug").is_key_must_be_absent());
}

TEST(JsonAssertion, EmptyPathListMeansRoot) {
    auto assertion = assert_json(Value({1, 2}), Value({1, 2, 3})).equal_count();
    EXPECT_TRUE(ResolvedNode::root(assertion.config()).is_equal_count());
    EXPECT_FALSE(assertion.check());
}

TEST(JsonAssertion, SeveralPathsAtOnce) {
    auto assertion = assert_json(Value({{"a", 1}, {"b", "x"}, {"c", true}}),
                                 Value({{"a", 2}, {"b", "y"}, {"c", false}}))
        .type_match({"a", "b"});

    auto result = assertion.validate();
    ASSERT_EQ(result.failures().size(), 1u);
    EXPECT_EQ(result.failures()[0].key_path(), "c");
}

TEST(JsonAssertion, LaterCallsOverrideEarlierOnes) {
    auto assertion = assert_json(Value({{"a", 1}}), Value({{"a", 2}}))
        .type_match({"a"})
        .exact_match({"a"});
    EXPECT_FALSE(assertion.check());

    auto relaxed = assert_json(Value({{"a", 1}}), Value({{"a", 2}}))
        .exact_match({"a"})
        .type_match({"a"});
    EXPECT_TRUE(relaxed.check());
}

TEST(JsonAssertion, StrictOrderUndoesAnyOrder) {
    auto assertion = assert_json(Value({1, 2}), Value({2, 1}))
        .any_order({}, Scope::Subtree)
        .strict_order({"[1]"});

    // [1] is positional and compares 2 against 1.
    auto result = assertion.validate();
    ASSERT_FALSE(result.is_valid());
    EXPECT_EQ(result.failures()[0].key_path(), "[1]");
}

TEST(JsonAssertion, FlexibleCountUndoesEqualCount) {
    auto assertion = assert_json(Value({{"list", {1}}}), Value({{"list", {1, 2}}}))
        .equal_count({}, Scope::Subtree)
        .flexible_count({"list"});
    EXPECT_TRUE(assertion.check());
}

TEST(JsonAssertion, ApplyMatchesNamedMethods) {
    auto a = assert_json(Value({{"a", 1}}), Value({{"a", 2}}))
        .apply(Option::ExactMatch, false, {"a"});
    EXPECT_TRUE(a.check());
}

// ============================================================================
// Absent values
// ============================================================================

TEST(JsonAssertion, AbsentExpectedIsMisuse) {
    auto result = assert_json(std::nullopt, Value({{"a", 1}})).validate();
    ASSERT_EQ(result.failures().size(), 1u);
    EXPECT_EQ(result.failures()[0].message(),
              "Expected is nil. If nil is expected, assert that actual is absent instead.");

    EXPECT_FALSE(assert_json(std::nullopt, std::nullopt).check());
}

TEST(JsonAssertion, AbsentActualFailsAtRoot) {
    auto result = assert_json(Value({{"a", 1}}), std::nullopt).validate();
    ASSERT_EQ(result.failures().size(), 1u);
    EXPECT_EQ(result.failures()[0].key_path(), "");
    EXPECT_EQ(result.failures()[0].message(), "Expected JSON is non-nil but Actual JSON is nil.");
    EXPECT_EQ(result.failures()[0].actual(), "nil");
}

TEST(JsonAssertion, KeyMustBeAbsentWithEmptyExpected) {
    auto absent = assert_json(Value::object(), Value({{"id", 1}}))
        .key_must_be_absent({"deleted"});
    EXPECT_TRUE(absent.check());

    auto present = assert_json(Value::object(), Value({{"id", 1}, {"deleted", false}}))
        .key_must_be_absent({"deleted"});
    auto result = present.validate();
    ASSERT_EQ(result.failures().size(), 1u);
    EXPECT_EQ(result.failures()[0].message(), "Actual JSON must not have key with name: deleted");
    EXPECT_EQ(result.failures()[0].key_path(), "deleted");
}

// ============================================================================
// Scenarios
// ============================================================================

TEST(JsonAssertionScenario, AnyOrderConsumesOneToOne) {
    auto ok = assert_json(Value({1, 2}), Value({2, 1, 3})).any_order({"[*]"});
    EXPECT_TRUE(ok.check());

    auto bad = assert_json(Value({1, 2, 99}), Value({2, 1, 3})).any_order({"[*]"});
    auto result = bad.validate();
    ASSERT_EQ(result.failures().size(), 1u);
    const auto& failure = result.failures()[0];
    EXPECT_EQ(failure.key_path(), "");
    EXPECT_EQ(failure.expected(), "99");
    EXPECT_EQ(failure.actual(), "Remaining unmatched elements: [3]");
    EXPECT_EQ(failure.message(),
              "Any order exact match found no matches on Actual side satisfying the Expected requirement.");
}

TEST(JsonAssertionScenario, DuplicateExpectedNeedsDuplicateActual) {
    auto assertion = assert_json(Value({1, 1}), Value({1, 2})).any_order({"[*]"});
    EXPECT_FALSE(assertion.check());
}

TEST(JsonAssertionScenario, TypeMatchOnDynamicField) {
    Value expected = to_value(R"({"id": 123})");
    Value actual = to_value(R"({"id": 456, "extra": "x"})");

    EXPECT_FALSE(assert_json(expected, actual).check());
    EXPECT_TRUE(assert_json(expected, actual).type_match({"id"}).check());
    EXPECT_TRUE(assert_json(expected, actual).type_match({}, Scope::Subtree).check());

    // Type-only matching still rejects a different type.
    auto result = assert_json(expected, to_value(R"({"id": "456"})"))
        .type_match({"id"})
        .validate();
    ASSERT_EQ(result.failures().size(), 1u);
    EXPECT_EQ(result.failures()[0].message(), "Expected and Actual types do not match.");
    EXPECT_EQ(result.failures()[0].expected(), "123 (Type: integer)");
    EXPECT_EQ(result.failures()[0].actual(), "\"456\" (Type: string)");
}

TEST(JsonAssertionScenario, FixedAndAnyOrderMix) {
    auto assertion = assert_json(Value({1, 2}), Value({1, 99, 2})).any_order({"[1]"});
    EXPECT_TRUE(assertion.check());
}

TEST(JsonAssertionScenario, WildcardWithNestedOverride) {
    Value expected = to_value(R"({
        "orders": [
            {"id": 1, "total": 10.5, "placed": "2024-01-01"},
            {"id": 2, "total": 99.0, "placed": "2024-01-02"}
        ]
    })");
    Value actual = to_value(R"({
        "orders": [
            {"id": 2, "total": 12.25, "placed": "2024-05-05"},
            {"id": 1, "total": 3.5, "placed": "2024-06-06"}
        ]
    })");

    // Values are relaxed below each order except the id.
    auto assertion = assert_json(expected, actual)
        .any_order({"orders[*]"})
        .type_match({"orders[*]"}, Scope::Subtree)
        .exact_match({"orders[*].id"});
    EXPECT_TRUE(assertion.check()) << assertion.validate();

    actual["orders"][1]["id"] = 3;
    auto result = assertion.validate();
    EXPECT_TRUE(result.is_valid()) << "the assertion keeps its own copy of actual";

    auto changed = assert_json(expected, actual)
        .any_order({"orders[*]"})
        .type_match({"orders[*]"}, Scope::Subtree)
        .exact_match({"orders[*].id"});
    EXPECT_FALSE(changed.check());
}

TEST(JsonAssertionScenario, ValueMustDiffer) {
    Value expected = {{"token", "old"}, {"user", "u1"}};

    auto rotated = assert_json(expected, Value({{"token", "new"}, {"user", "u1"}}))
        .value_not_equal({"token"});
    EXPECT_TRUE(rotated.check());

    auto stale = assert_json(expected, Value({{"token", "old"}, {"user", "u1"}}))
        .value_not_equal({"token"});
    auto result = stale.validate();
    ASSERT_EQ(result.failures().size(), 1u);
    EXPECT_EQ(result.failures()[0].message(), "Values must NOT be equal.");
}

TEST(JsonAssertionScenario, EveryMismatchIsReported) {
    Value expected = to_value(R"({"a": 1, "b": {"c": "x", "d": [1, 2]}, "e": true})");
    Value actual = to_value(R"({"a": 2, "b": {"c": "y", "d": [1, 3]}})");

    auto result = assert_json(expected, actual).validate();
    ASSERT_EQ(result.failures().size(), 4u);
    EXPECT_EQ(result.failures()[0].key_path(), "a");
    EXPECT_EQ(result.failures()[1].key_path(), "b.c");
    EXPECT_EQ(result.failures()[2].key_path(), "b.d[1]");
    EXPECT_EQ(result.failures()[3].key_path(), "e");
}

// ============================================================================
// Convenience entry points
// ============================================================================

TEST(ValidateEqual, RequiresEqualCountsEverywhere) {
    Value doc = to_value(R"({"a": [1, 2], "b": {"c": 1}})");
    EXPECT_TRUE(validate_equal(doc, doc).is_valid());

    Value bigger = to_value(R"({"a": [1, 2], "b": {"c": 1, "d": 2}})");
    auto result = validate_equal(doc, bigger);
    ASSERT_EQ(result.failures().size(), 1u);
    EXPECT_EQ(result.failures()[0].key_path(), "b");
    EXPECT_EQ(result.failures()[0].message(), "Expected JSON count does not match Actual JSON.");
}

TEST(ValidateEqual, AbsentValues) {
    EXPECT_TRUE(validate_equal(std::nullopt, std::nullopt).is_valid());

    auto missing_actual = validate_equal(Value(1), std::nullopt);
    ASSERT_EQ(missing_actual.failures().size(), 1u);
    EXPECT_EQ(missing_actual.failures()[0].message(), "Actual is nil and Expected is non-nil.");
    EXPECT_EQ(missing_actual.failures()[0].actual(), "nil");

    auto missing_expected = validate_equal(std::nullopt, Value(1));
    ASSERT_EQ(missing_expected.failures().size(), 1u);
    EXPECT_EQ(missing_expected.failures()[0].message(), "Expected is nil and Actual is non-nil.");
}

TEST(ValidateTypeMatch, IgnoresValues) {
    Value expected = to_value(R"({"id": 1, "tags": ["a"], "ok": true})");
    Value actual = to_value(R"({"id": 9, "tags": ["z", "y"], "ok": false})");
    EXPECT_TRUE(validate_type_match(expected, actual).is_valid());

    Value wrong = to_value(R"({"id": 9.5, "tags": ["z"], "ok": false})");
    EXPECT_FALSE(validate_type_match(expected, wrong).is_valid());
}

TEST(ValidateExactMatch, IsSubsetOnValues) {
    Value expected = to_value(R"({"id": 1})");
    EXPECT_TRUE(validate_exact_match(expected, to_value(R"({"id": 1, "x": 0})")).is_valid());
    EXPECT_FALSE(validate_exact_match(expected, to_value(R"({"id": 2})")).is_valid());
}
