/**
 * @file Assertion.cpp
 * @brief Implementation of the fluent assertion front end
 */

#include "jsonexpect/Assertion.hpp"
#include "jsonexpect/Engine.hpp"

namespace jsonexpect {

JsonAssertion::JsonAssertion(std::optional<Value> expected, std::optional<Value> actual)
    : expected_(std::move(expected))
    , actual_(std::move(actual))
    , config_(std::nullopt, Defaults())
{}

JsonAssertion& JsonAssertion::apply(Option option, bool value,
                                    const std::vector<Path>& paths, Scope scope) {
    if (paths.empty()) {
        config_.set_option(option, value, Path::root(), scope);
        return *this;
    }
    for (const auto& path : paths) {
        config_.set_option(option, value, path, scope);
    }
    return *this;
}

JsonAssertion& JsonAssertion::any_order(const std::vector<Path>& paths, Scope scope) {
    return apply(Option::AnyOrder, true, paths, scope);
}

JsonAssertion& JsonAssertion::strict_order(const std::vector<Path>& paths, Scope scope) {
    return apply(Option::AnyOrder, false, paths, scope);
}

JsonAssertion& JsonAssertion::equal_count(const std::vector<Path>& paths, Scope scope) {
    return apply(Option::EqualCount, true, paths, scope);
}

JsonAssertion& JsonAssertion::flexible_count(const std::vector<Path>& paths, Scope scope) {
    return apply(Option::EqualCount, false, paths, scope);
}

JsonAssertion& JsonAssertion::element_count(std::size_t count, const std::vector<Path>& paths) {
    if (paths.empty()) {
        config_.set_element_count(count, Path::root());
        return *this;
    }
    for (const auto& path : paths) {
        config_.set_element_count(count, path);
    }
    return *this;
}

JsonAssertion& JsonAssertion::exact_match(const std::vector<Path>& paths, Scope scope) {
    return apply(Option::ExactMatch, true, paths, scope);
}

JsonAssertion& JsonAssertion::type_match(const std::vector<Path>& paths, Scope scope) {
    return apply(Option::ExactMatch, false, paths, scope);
}

JsonAssertion& JsonAssertion::value_not_equal(const std::vector<Path>& paths, Scope scope) {
    return apply(Option::ValueNotEqual, true, paths, scope);
}

JsonAssertion& JsonAssertion::key_must_be_absent(const std::vector<Path>& paths) {
    return apply(Option::KeyMustBeAbsent, true, paths, Scope::SingleNode);
}

ValidationResult JsonAssertion::validate() const {
    if (!expected_) {
        return ValidationResult::failure(ValidationFailure(
            "", "Expected is nil. If nil is expected, assert that actual is absent instead."));
    }
    return jsonexpect::validate(expected_, actual_, config_);
}

bool JsonAssertion::check() const {
    return validate().is_valid();
}

// ============================================================================
// Convenience entry points
// ============================================================================

JsonAssertion assert_json(std::optional<Value> expected, std::optional<Value> actual) {
    return JsonAssertion(std::move(expected), std::move(actual));
}

ValidationResult validate_equal(const std::optional<Value>& expected,
                                const std::optional<Value>& actual) {
    if (!expected && !actual) {
        return ValidationResult::success();
    }
    if (!expected || !actual) {
        const char* absent = expected ? "Actual" : "Expected";
        const char* present = expected ? "Expected" : "Actual";
        return ValidationResult::failure(ValidationFailure(
            "", std::string(absent) + " is nil and " + present + " is non-nil.",
            expected ? render(*expected) : std::string("nil"),
            actual ? render(*actual) : std::string("nil")));
    }
    return assert_json(expected, actual)
        .equal_count({}, Scope::Subtree)
        .validate();
}

ValidationResult validate_type_match(const std::optional<Value>& expected,
                                     const std::optional<Value>& actual) {
    return assert_json(expected, actual)
        .type_match({}, Scope::Subtree)
        .validate();
}

ValidationResult validate_exact_match(const std::optional<Value>& expected,
                                      const std::optional<Value>& actual) {
    return assert_json(expected, actual).validate();
}

} // namespace jsonexpect
