/**
 * @file Engine.cpp
 * @brief Implementation of the comparison engine
 */

#include "jsonexpect/Engine.hpp"

#include <vector>

namespace jsonexpect {

std::string key_path_string(const Path& path) {
    std::string out;
    bool first = true;
    for (const auto& component : path.components()) {
        switch (component.type()) {
            case Component::Type::Key:
                if (!first) out += '.';
                // An empty key would vanish from the path, so it is quoted.
                if (component.name().empty()) {
                    out += "\"\"";
                } else {
                    out += escape_key(component.name());
                }
                break;
            case Component::Type::Index:
                out += '[' + std::to_string(component.position()) + ']';
                break;
            case Component::Type::WildcardKey:
                if (!first) out += '.';
                out += '*';
                break;
            case Component::Type::WildcardIndex:
                out += "[*]";
                break;
        }
        first = false;
    }
    return out;
}

namespace {

    const char* const kMissingMessage =
        "Expected JSON is non-nil but Actual JSON is nil.";
    const char* const kTypeMismatchMessage =
        "Expected and Actual types do not match.";
    const char* const kValueMismatchMessage =
        "Values do not match.";
    const char* const kValueEqualMessage =
        "Values must NOT be equal.";
    const char* const kEqualCountMessage =
        "Expected JSON count does not match Actual JSON.";
    const char* const kSubsetCountMessage =
        "Expected JSON has more elements than Actual JSON.";
    const char* const kElementCountMessage =
        "The expected element count is not equal to the actual number of elements.";
    const char* const kElementCountMisuseMessage =
        "Invalid elementCount assertion on a non-collection element. "
        "Remove elementCount requirements from this key path in the test setup.";

    std::string with_type(const Value& value) {
        return render(value) + " (Type: " + type_name(value) + ")";
    }

    std::string with_count(const Value& value) {
        return "count: " + std::to_string(value.size()) + " - " + render(value);
    }

    // ========================================================================
    // Pass B: expected vs actual
    // ========================================================================

    ValidationResult compare(const Value* expected, const Value* actual,
                             const Path& path, const ResolvedNode& config);

    ValidationResult compare_primitive(const Value& expected, const Value& actual,
                                       const Path& path, const ResolvedNode& config) {
        if (config.is_value_not_equal()) {
            if (values_equal(expected, actual)) {
                return ValidationResult::failure(ValidationFailure(
                    key_path_string(path), kValueEqualMessage,
                    render(expected), render(actual)));
            }
            return ValidationResult::success();
        }

        // Without exact matching, the kind check done by the caller suffices.
        if (config.is_exact_match() && !values_equal(expected, actual)) {
            return ValidationResult::failure(ValidationFailure(
                key_path_string(path), kValueMismatchMessage,
                render(expected), render(actual)));
        }
        return ValidationResult::success();
    }

    ValidationResult check_count(const Value& expected, const Value& actual,
                                 const Path& path, const ResolvedNode& config) {
        if (config.is_equal_count()) {
            if (expected.size() != actual.size()) {
                return ValidationResult::failure(ValidationFailure(
                    key_path_string(path), kEqualCountMessage,
                    with_count(expected), with_count(actual)));
            }
        } else if (expected.size() > actual.size()) {
            return ValidationResult::failure(ValidationFailure(
                key_path_string(path), kSubsetCountMessage,
                with_count(expected), with_count(actual)));
        }
        return ValidationResult::success();
    }

    ValidationResult check_collection_inequality(const Value& expected, const Value& actual,
                                                 const Path& path, const ResolvedNode& config) {
        if (config.is_value_not_equal() && values_equal(expected, actual)) {
            return ValidationResult::failure(ValidationFailure(
                key_path_string(path), kValueEqualMessage,
                render(expected), render(actual)));
        }
        return ValidationResult::success();
    }

    ValidationResult compare_object(const Value& expected, const Value& actual,
                                    const Path& path, const ResolvedNode& config) {
        ValidationResult result = check_count(expected, actual, path, config);
        result.combine(check_collection_inequality(expected, actual, path, config));

        for (auto it = expected.begin(); it != expected.end(); ++it) {
            const std::string& key = it.key();
            auto found = actual.find(key);
            const Value* actual_child = found == actual.end() ? nullptr : &*found;

            result.combine(compare(&it.value(), actual_child,
                                   path.appending(Component::key(key)),
                                   config.resolved_child(key)));
        }

        return result;
    }

    ValidationResult compare_array(const Value& expected, const Value& actual,
                                   const Path& path, const ResolvedNode& config) {
        ValidationResult result = check_count(expected, actual, path, config);
        result.combine(check_collection_inequality(expected, actual, path, config));

        std::vector<std::size_t> fixed_order;
        std::vector<std::size_t> any_order;
        for (std::size_t i = 0; i < expected.size(); ++i) {
            if (config.resolved_child(i).is_any_order()) {
                any_order.push_back(i);
            } else {
                fixed_order.push_back(i);
            }
        }

        // Positions compared positionally are never offered to any-order
        // matching, whether or not they matched.
        std::vector<bool> claimed(actual.size(), false);
        for (std::size_t i : fixed_order) {
            if (i < claimed.size()) claimed[i] = true;
        }

        for (std::size_t i : fixed_order) {
            const Value* actual_child = i < actual.size() ? &actual[i] : nullptr;
            result.combine(compare(&expected[i], actual_child,
                                   path.appending(Component::index(i)),
                                   config.resolved_child(i)));
        }

        for (std::size_t i : any_order) {
            const ResolvedNode child = config.resolved_child(i);
            const Path child_path = path.appending(Component::index(i));

            bool matched = false;
            for (std::size_t j = 0; j < actual.size(); ++j) {
                if (claimed[j]) continue;
                if (compare(&expected[i], &actual[j], child_path, child).is_valid()) {
                    claimed[j] = true;
                    matched = true;
                    break;
                }
            }

            if (!matched) {
                Value remaining = Value::array();
                for (std::size_t j = 0; j < actual.size(); ++j) {
                    if (!claimed[j]) remaining.push_back(actual[j]);
                }
                result.combine(ValidationResult::failure(ValidationFailure(
                    key_path_string(path),
                    std::string("Any order ") + (child.is_exact_match() ? "exact" : "type") +
                        " match found no matches on Actual side satisfying the Expected requirement.",
                    render(expected[i]),
                    "Remaining unmatched elements: " + render(remaining))));
                // Stop at the first unmatched element.
                break;
            }
        }

        return result;
    }

    ValidationResult compare(const Value* expected, const Value* actual,
                             const Path& path, const ResolvedNode& config) {
        if (expected == nullptr || expected->is_null()) {
            return ValidationResult::success();
        }

        if (actual == nullptr) {
            return ValidationResult::failure(ValidationFailure(
                key_path_string(path), kMissingMessage, render(*expected), "nil"));
        }

        if (!same_kind(*expected, *actual)) {
            return ValidationResult::failure(ValidationFailure(
                key_path_string(path), kTypeMismatchMessage,
                with_type(*expected), with_type(*actual)));
        }

        switch (kind_of(*expected)) {
            case Kind::Object:
                return compare_object(*expected, *actual, path, config);
            case Kind::Array:
                return compare_array(*expected, *actual, path, config);
            default:
                return compare_primitive(*expected, *actual, path, config);
        }
    }

    // ========================================================================
    // Pass A: actual-only constraints
    // ========================================================================

    ValidationResult check_element_count(const Value& actual, const Path& path,
                                         const ResolvedNode& config) {
        const auto& count = config.element_count();
        if (count && actual.size() != *count) {
            return ValidationResult::failure(ValidationFailure(
                key_path_string(path), kElementCountMessage,
                "count: " + std::to_string(*count),
                "count: " + std::to_string(actual.size())));
        }
        return ValidationResult::success();
    }

    ValidationResult check_constraints(const Value* actual, const Path& path,
                                       const ResolvedNode& config) {
        if (actual == nullptr) {
            return ValidationResult::success();
        }

        ValidationResult result;

        if (actual->is_object()) {
            for (auto it = actual->begin(); it != actual->end(); ++it) {
                const std::string& key = it.key();
                const ResolvedNode child = config.resolved_child(key);
                const Path child_path = path.appending(Component::key(key));

                if (child.is_key_must_be_absent()) {
                    result.combine(ValidationResult::failure(ValidationFailure(
                        key_path_string(child_path),
                        "Actual JSON must not have key with name: " + key,
                        std::nullopt, render(*actual))));
                }
                result.combine(check_constraints(&it.value(), child_path, child));
            }
            result.combine(check_element_count(*actual, path, config));
        } else if (actual->is_array()) {
            for (std::size_t i = 0; i < actual->size(); ++i) {
                result.combine(check_constraints(&(*actual)[i],
                                                 path.appending(Component::index(i)),
                                                 config.resolved_child(i)));
            }
            result.combine(check_element_count(*actual, path, config));
        } else if (config.element_count()) {
            result.combine(ValidationResult::failure(ValidationFailure(
                key_path_string(path), kElementCountMisuseMessage)));
        }

        return result;
    }

} // namespace

ValidationResult validate(const Value* expected, const Value* actual,
                          const NodeConfig& config) {
    const ResolvedNode root = ResolvedNode::root(config);

    ValidationResult result = check_constraints(actual, Path::root(), root);
    result.combine(compare(expected, actual, Path::root(), root));
    return result;
}

ValidationResult validate(const std::optional<Value>& expected,
                          const std::optional<Value>& actual,
                          const NodeConfig& config) {
    return validate(expected ? &*expected : nullptr,
                    actual ? &*actual : nullptr,
                    config);
}

ValidationResult validate(const Value& expected, const Value& actual,
                          const NodeConfig& config) {
    return validate(&expected, &actual, config);
}

} // namespace jsonexpect
