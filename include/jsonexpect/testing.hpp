/**
 * @file testing.hpp
 * @brief GoogleTest integration
 *
 * ```cpp
 * #include <jsonexpect/testing.hpp>
 *
 * TEST(Api, ReturnsUser) {
 *     auto actual = jsonexpect::to_value(response_body);
 *     EXPECT_JSON_MATCH(jsonexpect::assert_json(expected, actual)
 *                           .type_match({"createdAt"}));
 * }
 * ```
 *
 * Every failure of the run is reported in the assertion message.
 */

#ifndef JSONEXPECT_TESTING_HPP
#define JSONEXPECT_TESTING_HPP

#include "jsonexpect/Assertion.hpp"
#include "jsonexpect/Result.hpp"

#include <gtest/gtest.h>

namespace jsonexpect {
namespace testing {

/**
 * @brief Turn a ValidationResult into a GoogleTest assertion result
 */
inline ::testing::AssertionResult matches(const ValidationResult& result) {
    if (result.is_valid()) {
        return ::testing::AssertionSuccess();
    }
    ::testing::AssertionResult failure = ::testing::AssertionFailure();
    failure << result.failures().size() << " JSON validation failure(s):\n\n"
            << result.describe();
    return failure;
}

/// Run the assertion and report its result
inline ::testing::AssertionResult matches(const JsonAssertion& assertion) {
    return matches(assertion.validate());
}

} // namespace testing
} // namespace jsonexpect

/// Non-fatal: accepts a JsonAssertion or a ValidationResult
#define EXPECT_JSON_MATCH(assertion) \
    EXPECT_TRUE(::jsonexpect::testing::matches(assertion))

/// Fatal: accepts a JsonAssertion or a ValidationResult
#define ASSERT_JSON_MATCH(assertion) \
    ASSERT_TRUE(::jsonexpect::testing::matches(assertion))

#endif // JSONEXPECT_TESTING_HPP
