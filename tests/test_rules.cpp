/**
 * @file test_rules.cpp
 * @brief Unit tests for option rules (GoogleTest)
 *
 * Covers:
 * - Option names
 * - Rule document parsing and its error reporting
 * - Applying rules to an assertion
 */

#include <gtest/gtest.h>
#include "jsonexpect/Errors.hpp"
#include "jsonexpect/Rules.hpp"

using namespace jsonexpect;

namespace {

Value rules_doc(const char* text) {
    return Value::parse(text);
}

} // namespace

// ============================================================================
// Names
// ============================================================================

TEST(RuleKindNames, RoundTrip) {
    const RuleKind kinds[] = {
        RuleKind::AnyOrder, RuleKind::StrictOrder, RuleKind::EqualCount,
        RuleKind::FlexibleCount, RuleKind::ElementCount, RuleKind::ExactMatch,
        RuleKind::TypeMatch, RuleKind::KeyMustBeAbsent, RuleKind::ValueNotEqual,
    };
    for (RuleKind kind : kinds) {
        auto back = rule_kind_from_name(rule_kind_name(kind));
        ASSERT_TRUE(back.has_value()) << rule_kind_name(kind);
        EXPECT_EQ(*back, kind);
    }
}

TEST(RuleKindNames, KnownSpellings) {
    EXPECT_EQ(rule_kind_name(RuleKind::AnyOrder), "any-order");
    EXPECT_EQ(rule_kind_name(RuleKind::KeyMustBeAbsent), "key-must-be-absent");
    EXPECT_FALSE(rule_kind_from_name("anyOrder").has_value());
    EXPECT_FALSE(rule_kind_from_name("").has_value());
}

TEST(RulePath, DollarIsRoot) {
    EXPECT_TRUE(parse_rule_path("$").is_root());
    EXPECT_EQ(parse_rule_path("a.b[0]"), Path::parse("a.b[0]"));
    EXPECT_EQ(parse_rule_path(""), Path::parse(""));
}

// ============================================================================
// parse_rules
// ============================================================================

TEST(ParseRules, FullRule) {
    auto rules = parse_rules(rules_doc(R"({"rule": [
        {"option": "type-match", "paths": ["a", "b[*].c"], "scope": "subtree"}
    ]})"));

    ASSERT_EQ(rules.size(), 1u);
    EXPECT_EQ(rules[0].kind, RuleKind::TypeMatch);
    EXPECT_EQ(rules[0].scope, Scope::Subtree);
    ASSERT_EQ(rules[0].paths.size(), 2u);
    EXPECT_EQ(rules[0].paths[1], Path::parse("b[*].c"));
}

TEST(ParseRules, DefaultsToRootAndNodeScope) {
    auto rules = parse_rules(rules_doc(R"({"rule": [{"option": "equal-count"}]})"));

    ASSERT_EQ(rules.size(), 1u);
    EXPECT_TRUE(rules[0].paths.empty());
    EXPECT_EQ(rules[0].scope, Scope::SingleNode);
}

TEST(ParseRules, SinglePathString) {
    auto rules = parse_rules(rules_doc(R"({"rule": [{"option": "any-order", "paths": "$"}]})"));

    ASSERT_EQ(rules[0].paths.size(), 1u);
    EXPECT_TRUE(rules[0].paths[0].is_root());
}

TEST(ParseRules, ElementCount) {
    auto rules = parse_rules(rules_doc(R"({"rule": [
        {"option": "element-count", "paths": "items", "count": 0}
    ]})"));

    EXPECT_EQ(rules[0].kind, RuleKind::ElementCount);
    EXPECT_EQ(rules[0].count, 0u);
}

TEST(ParseRules, EmptyList) {
    EXPECT_TRUE(parse_rules(rules_doc(R"({"rule": []})")).empty());
}

TEST(ParseRules, DocumentLevelErrors) {
    EXPECT_THROW(parse_rules(rules_doc("[1]")), RuleError);
    EXPECT_THROW(parse_rules(rules_doc("{}")), RuleError);
    EXPECT_THROW(parse_rules(rules_doc(R"({"rule": {}})")), RuleError);

    try {
        parse_rules(rules_doc("{}"));
        FAIL() << "expected RuleError";
    } catch (const RuleError& e) {
        EXPECT_EQ(e.index(), -1);
        EXPECT_STREQ(e.what(), "Invalid rules: missing 'rule' list");
    }
}

TEST(ParseRules, ErrorNamesRuleIndex) {
    try {
        parse_rules(rules_doc(R"({"rule": [
            {"option": "exact-match"},
            {"option": "sideways"}
        ]})"));
        FAIL() << "expected RuleError";
    } catch (const RuleError& e) {
        EXPECT_EQ(e.index(), 1);
        EXPECT_EQ(e.reason(), "unknown option 'sideways'");
        EXPECT_STREQ(e.what(), "Invalid rule #1: unknown option 'sideways'");
    }
}

TEST(ParseRules, MalformedRules) {
    const char* bad[] = {
        R"({"rule": [42]})",
        R"({"rule": [{}]})",
        R"({"rule": [{"option": 3}]})",
        R"({"rule": [{"option": "exact-match", "path": "a"}]})",
        R"({"rule": [{"option": "exact-match", "paths": 5}]})",
        R"({"rule": [{"option": "exact-match", "paths": ["a", 1]}]})",
        R"({"rule": [{"option": "exact-match", "scope": "everywhere"}]})",
        R"({"rule": [{"option": "exact-match", "scope": true}]})",
        R"({"rule": [{"option": "exact-match", "count": 1}]})",
        R"({"rule": [{"option": "element-count"}]})",
        R"({"rule": [{"option": "element-count", "count": -1}]})",
        R"({"rule": [{"option": "element-count", "count": 1.5}]})",
        R"({"rule": [{"option": "element-count", "count": "2"}]})",
        R"({"rule": [{"option": "element-count", "count": 1, "scope": "subtree"}]})",
        R"({"rule": [{"option": "key-must-be-absent", "paths": "a", "scope": "subtree"}]})",
    };
    for (const char* text : bad) {
        EXPECT_THROW(parse_rules(rules_doc(text)), RuleError) << text;
    }
}

// ============================================================================
// apply_rules
// ============================================================================

TEST(ApplyRules, RulesChangeTheOutcome) {
    Value expected = Value::parse(R"({"items": [{"id": 1}, {"id": 2}], "ts": 0})");
    Value actual = Value::parse(R"({"items": [{"id": 2}, {"id": 1}], "ts": 1700000000})");

    auto plain = assert_json(expected, actual);
    EXPECT_FALSE(plain.check());

    auto rules = parse_rules(rules_doc(R"({"rule": [
        {"option": "any-order", "paths": "items[*]"},
        {"option": "type-match", "paths": "ts"}
    ]})"));
    auto relaxed = assert_json(expected, actual);
    apply_rules(relaxed, rules);
    EXPECT_TRUE(relaxed.check()) << relaxed.validate();
}

TEST(ApplyRules, LaterRulesOverrideEarlierOnes) {
    Value expected = {{"n", 1}};
    Value actual = {{"n", 2}};

    auto rules = parse_rules(rules_doc(R"({"rule": [
        {"option": "type-match", "scope": "subtree"},
        {"option": "exact-match", "paths": "n"}
    ]})"));
    auto assertion = assert_json(expected, actual);
    apply_rules(assertion, rules);

    auto result = assertion.validate();
    ASSERT_EQ(result.failures().size(), 1u);
    EXPECT_EQ(result.failures()[0].key_path(), "n");
    EXPECT_EQ(result.failures()[0].message(), "Values do not match.");
}

TEST(ApplyRules, ElementCountAndAbsentKey) {
    Value expected = Value::object();
    Value actual = Value::parse(R"({"items": [1, 2, 3], "debug": true})");

    auto rules = parse_rules(rules_doc(R"({"rule": [
        {"option": "element-count", "paths": "items", "count": 2},
        {"option": "key-must-be-absent", "paths": ["debug"]}
    ]})"));
    auto assertion = assert_json(expected, actual);
    apply_rules(assertion, rules);

    auto result = assertion.validate();
    ASSERT_EQ(result.failures().size(), 2u);
    EXPECT_EQ(result.failures()[0].key_path(), "items");
    EXPECT_EQ(result.failures()[1].key_path(), "debug");
}
