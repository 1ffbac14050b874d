/**
 * @file Engine.hpp
 * @brief Structural comparison of an expected and an actual JSON value
 *
 * validate() runs two independent passes and concatenates their failures:
 *
 * Pass A (actual-only constraints) walks the actual document and reports
 * keys that must be absent and collections whose size differs from a
 * configured element count. An element count on a non-collection value
 * is reported as invalid use.
 *
 * Pass B (expected vs actual) walks the expected document:
 * - absent or null expected: no requirement
 * - expected present, actual absent: missing value
 * - different JSON types: type mismatch (regardless of exact matching)
 * - primitives: equal values under exact matching, same type otherwise
 * - objects and arrays: expected may not have more entries than actual
 *   (or exactly as many under equal count); every expected entry is
 *   compared recursively. Array elements configured for any-order matching
 *   are matched one-to-one against actual elements not consumed by the
 *   positional elements.
 */

#ifndef JSONEXPECT_ENGINE_HPP
#define JSONEXPECT_ENGINE_HPP

#include "jsonexpect/NodeConfig.hpp"
#include "jsonexpect/Result.hpp"
#include "jsonexpect/Value.hpp"

#include <optional>

namespace jsonexpect {

/**
 * @brief Validate actual against expected under a configuration tree
 *
 * @param expected Expected value, nullptr when absent
 * @param actual Actual value, nullptr when absent
 * @param config Root of the configuration tree
 * @return Success, or every failure found
 *
 * Never throws for any input shape.
 *
 * Example:
 * ```cpp
 * Value expected = {{"id", 123}};
 * Value actual = {{"id", 456}, {"extra", "x"}};
 *
 * NodeConfig config;
 * validate(&expected, &actual, config).is_valid();   // false: "Values do not match."
 *
 * config.set_option(Option::ExactMatch, false, Path::parse("id"), Scope::SingleNode);
 * validate(&expected, &actual, config).is_valid();   // true
 * ```
 */
ValidationResult validate(const Value* expected, const Value* actual,
                          const NodeConfig& config);

/// Same as above with std::nullopt meaning absent
ValidationResult validate(const std::optional<Value>& expected,
                          const std::optional<Value>& actual,
                          const NodeConfig& config);

/// Both values present
ValidationResult validate(const Value& expected, const Value& actual,
                          const NodeConfig& config = NodeConfig());

/**
 * @brief Render a failure position
 *
 * Like Path::to_string(), except that an empty object key is printed as
 * "" so it remains visible in diagnostics.
 */
std::string key_path_string(const Path& path);

} // namespace jsonexpect

#endif // JSONEXPECT_ENGINE_HPP
