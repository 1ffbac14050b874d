/**
 * @file test_result.cpp
 * @brief Unit tests for ValidationFailure / ValidationResult (GoogleTest)
 */

#include <gtest/gtest.h>
#include "jsonexpect/Result.hpp"

#include <sstream>

using namespace jsonexpect;

// ============================================================================
// ValidationFailure
// ============================================================================

TEST(ValidationFailure, DescribeWithAllParts) {
    ValidationFailure f("id", "Values do not match.", "123", "456");
    EXPECT_EQ(f.describe(),
              "Values do not match.\n\nExpected: 123\n\nActual: 456\n\nKey path: id");
}

TEST(ValidationFailure, DescribeOmitsMissingParts) {
    ValidationFailure f("", "Something is off.");
    EXPECT_EQ(f.describe(), "Something is off.");
}

TEST(ValidationFailure, DescribeActualOnly) {
    ValidationFailure f("deleted", "Actual JSON must not have key with name: deleted",
                        std::nullopt, "{\"deleted\":true}");
    EXPECT_EQ(f.describe(),
              "Actual JSON must not have key with name: deleted\n\n"
              "Actual: {\"deleted\":true}\n\nKey path: deleted");
}

TEST(ValidationFailure, ToJson) {
    ValidationFailure f("a[0]", "Values do not match.", "1", std::nullopt);
    Value j = f.to_json();
    EXPECT_EQ(j["keyPath"], "a[0]");
    EXPECT_EQ(j["message"], "Values do not match.");
    EXPECT_EQ(j["expected"], "1");
    EXPECT_TRUE(j["actual"].is_null());
}

// ============================================================================
// ValidationResult
// ============================================================================

TEST(ValidationResult, DefaultIsSuccess) {
    ValidationResult r;
    EXPECT_TRUE(r.is_valid());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_TRUE(r.failures().empty());
    EXPECT_EQ(r.describe(), "OK");
    EXPECT_EQ(r.to_json(), Value::array());
}

TEST(ValidationResult, CombiningSuccessesIsSuccess) {
    auto r = ValidationResult::success().combined(ValidationResult::success());
    EXPECT_TRUE(r.is_valid());
}

TEST(ValidationResult, CombineConcatenatesInOrder) {
    auto a = ValidationResult::failure(ValidationFailure("a", "first"));
    auto b = ValidationResult::failure({ValidationFailure("b", "second"),
                                        ValidationFailure("c", "third")});

    auto combined = a.combined(b);
    ASSERT_EQ(combined.failures().size(), 3u);
    EXPECT_EQ(combined.failures()[0].key_path(), "a");
    EXPECT_EQ(combined.failures()[1].key_path(), "b");
    EXPECT_EQ(combined.failures()[2].key_path(), "c");

    // combined() leaves the receiver untouched
    EXPECT_EQ(a.failures().size(), 1u);

    a.combine(b);
    EXPECT_EQ(a.failures().size(), 3u);
}

TEST(ValidationResult, DescribeSeparatesFailures) {
    auto r = ValidationResult::failure({ValidationFailure("", "one"), ValidationFailure("", "two")});
    EXPECT_EQ(r.describe(), "one\n\n----\n\ntwo");
}

TEST(ValidationResult, StreamOperator) {
    std::ostringstream os;
    os << ValidationResult::failure(ValidationFailure("x", "bad"));
    EXPECT_EQ(os.str(), "bad\n\nKey path: x");
}

TEST(ValidationResult, ToJsonArray) {
    auto r = ValidationResult::failure(ValidationFailure("x", "bad", "1", "2"));
    Value j = r.to_json();
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["keyPath"], "x");
    EXPECT_EQ(j[0]["actual"], "2");
}
