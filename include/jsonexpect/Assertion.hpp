/**
 * @file Assertion.hpp
 * @brief Fluent front end over the configuration tree and the engine
 *
 * Usage:
 * ```cpp
 * auto result = jsonexpect::assert_json(expected, actual)
 *     .any_order({"items[*]"})
 *     .type_match({"items[*].timestamp"})
 *     .key_must_be_absent({"debug"})
 *     .validate();
 *
 * if (!result.is_valid()) {
 *     std::cerr << result << "\n";
 * }
 * ```
 *
 * Every option method takes a list of paths; an empty list applies the
 * option at the root. Options are applied in call order, so a later call
 * overrides an earlier one at the same node.
 */

#ifndef JSONEXPECT_ASSERTION_HPP
#define JSONEXPECT_ASSERTION_HPP

#include "jsonexpect/NodeConfig.hpp"
#include "jsonexpect/Path.hpp"
#include "jsonexpect/Result.hpp"
#include "jsonexpect/Value.hpp"

#include <optional>
#include <vector>

namespace jsonexpect {

/**
 * @brief Chainable validation request for one expected/actual pair
 */
class JsonAssertion {
public:
    /**
     * @brief Create an assertion with exact-match defaults
     *
     * @param expected Expected value; std::nullopt is reported as misuse
     * @param actual Actual value; std::nullopt means absent
     */
    JsonAssertion(std::optional<Value> expected, std::optional<Value> actual);

    // ========================================================================
    // Array ordering
    // ========================================================================

    /// Match array elements at paths regardless of position
    JsonAssertion& any_order(const std::vector<Path>& paths = {},
                             Scope scope = Scope::SingleNode);

    /// Match array elements at paths positionally (default)
    JsonAssertion& strict_order(const std::vector<Path>& paths = {},
                                Scope scope = Scope::SingleNode);

    // ========================================================================
    // Collection counts
    // ========================================================================

    /// Require expected and actual collections at paths to have the same size
    JsonAssertion& equal_count(const std::vector<Path>& paths = {},
                               Scope scope = Scope::SingleNode);

    /// Allow extra entries on the actual side (default)
    JsonAssertion& flexible_count(const std::vector<Path>& paths = {},
                                  Scope scope = Scope::SingleNode);

    /// Require the actual collections at paths to hold exactly count entries
    JsonAssertion& element_count(std::size_t count, const std::vector<Path>& paths = {});

    // ========================================================================
    // Value matching
    // ========================================================================

    /// Require equal values at paths (default)
    JsonAssertion& exact_match(const std::vector<Path>& paths = {},
                               Scope scope = Scope::SingleNode);

    /// Require only equal JSON types at paths
    JsonAssertion& type_match(const std::vector<Path>& paths = {},
                              Scope scope = Scope::SingleNode);

    /// Require values at paths to differ from expected
    JsonAssertion& value_not_equal(const std::vector<Path>& paths = {},
                                   Scope scope = Scope::SingleNode);

    // ========================================================================
    // Key presence
    // ========================================================================

    /// Fail if the actual document has any of these keys
    JsonAssertion& key_must_be_absent(const std::vector<Path>& paths = {});

    // ========================================================================
    // Generic application
    // ========================================================================

    /// Set option to value at every path (root if none)
    JsonAssertion& apply(Option option, bool value, const std::vector<Path>& paths,
                         Scope scope = Scope::SingleNode);

    // ========================================================================
    // Terminals
    // ========================================================================

    /// Run the engine and return every failure
    ValidationResult validate() const;

    /// Same as validate().is_valid()
    bool check() const;

    const NodeConfig& config() const noexcept { return config_; }
    const std::optional<Value>& expected() const noexcept { return expected_; }
    const std::optional<Value>& actual() const noexcept { return actual_; }

private:
    std::optional<Value> expected_;
    std::optional<Value> actual_;
    NodeConfig config_;
};

/**
 * @brief Start a fluent assertion
 *
 * Text inputs should go through to_value() first so JSON strings are parsed.
 */
JsonAssertion assert_json(std::optional<Value> expected, std::optional<Value> actual);

/**
 * @brief Full equality: exact values with equal counts everywhere
 *
 * Two absent values are equal. Exactly one absent value fails.
 */
ValidationResult validate_equal(const std::optional<Value>& expected,
                                const std::optional<Value>& actual);

/// Subset match on JSON types only, everywhere
ValidationResult validate_type_match(const std::optional<Value>& expected,
                                     const std::optional<Value>& actual);

/// Subset match on values (the defaults)
ValidationResult validate_exact_match(const std::optional<Value>& expected,
                                      const std::optional<Value>& actual);

} // namespace jsonexpect

#endif // JSONEXPECT_ASSERTION_HPP
