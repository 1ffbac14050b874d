/**
 * @file Result.hpp
 * @brief Validation outcome types
 *
 * A validation run never throws for a mismatch: it returns a
 * ValidationResult that is either success or an ordered, non-empty list
 * of ValidationFailure records.
 */

#ifndef JSONEXPECT_RESULT_HPP
#define JSONEXPECT_RESULT_HPP

#include "jsonexpect/Value.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace jsonexpect {

/**
 * @brief A single mismatch between expected and actual
 */
class ValidationFailure {
public:
    ValidationFailure(std::string key_path, std::string message,
                      std::optional<std::string> expected = std::nullopt,
                      std::optional<std::string> actual = std::nullopt)
        : key_path_(std::move(key_path))
        , message_(std::move(message))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    /// Position of the failure, e.g. "users[0].name"; empty at the root
    const std::string& key_path() const noexcept { return key_path_; }
    const std::string& message() const noexcept { return message_; }
    const std::optional<std::string>& expected() const noexcept { return expected_; }
    const std::optional<std::string>& actual() const noexcept { return actual_; }

    /**
     * @brief Human-readable rendering
     *
     * ```
     * Values do not match.
     *
     * Expected: 123
     *
     * Actual: 456
     *
     * Key path: id
     * ```
     */
    std::string describe() const;

    /// {"keyPath": ..., "message": ..., "expected": ..., "actual": ...}
    Value to_json() const;

private:
    std::string key_path_;
    std::string message_;
    std::optional<std::string> expected_;
    std::optional<std::string> actual_;
};

/**
 * @brief Outcome of a validation run
 *
 * Results combine by concatenating their failure lists.
 */
class ValidationResult {
public:
    /// Success
    ValidationResult() = default;

    static ValidationResult success() { return ValidationResult(); }
    static ValidationResult failure(ValidationFailure failure);
    static ValidationResult failure(std::vector<ValidationFailure> failures);

    bool is_valid() const noexcept { return failures_.empty(); }
    explicit operator bool() const noexcept { return is_valid(); }

    const std::vector<ValidationFailure>& failures() const noexcept { return failures_; }

    /// New result holding this result's failures followed by other's
    ValidationResult combined(const ValidationResult& other) const;

    /// Append other's failures to this result
    ValidationResult& combine(ValidationResult other);

    /// Failures separated by blank lines; "OK" on success
    std::string describe() const;

    /// JSON array of failures
    Value to_json() const;

private:
    std::vector<ValidationFailure> failures_;
};

std::ostream& operator<<(std::ostream& os, const ValidationFailure& failure);
std::ostream& operator<<(std::ostream& os, const ValidationResult& result);

} // namespace jsonexpect

#endif // JSONEXPECT_RESULT_HPP
