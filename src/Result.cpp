/**
 * @file Result.cpp
 * @brief Implementation of validation outcome types
 */

#include "jsonexpect/Result.hpp"

#include <iterator>

namespace jsonexpect {

std::string ValidationFailure::describe() const {
    std::string result = message_;
    if (expected_) {
        result += "\n\nExpected: " + *expected_;
    }
    if (actual_) {
        result += "\n\nActual: " + *actual_;
    }
    if (!key_path_.empty()) {
        result += "\n\nKey path: " + key_path_;
    }
    return result;
}

Value ValidationFailure::to_json() const {
    Value out = Value::object();
    out["keyPath"] = key_path_;
    out["message"] = message_;
    out["expected"] = expected_ ? Value(*expected_) : Value(nullptr);
    out["actual"] = actual_ ? Value(*actual_) : Value(nullptr);
    return out;
}

ValidationResult ValidationResult::failure(ValidationFailure failure) {
    ValidationResult result;
    result.failures_.push_back(std::move(failure));
    return result;
}

ValidationResult ValidationResult::failure(std::vector<ValidationFailure> failures) {
    ValidationResult result;
    result.failures_ = std::move(failures);
    return result;
}

ValidationResult ValidationResult::combined(const ValidationResult& other) const {
    ValidationResult result = *this;
    result.failures_.insert(result.failures_.end(),
                            other.failures_.begin(), other.failures_.end());
    return result;
}

ValidationResult& ValidationResult::combine(ValidationResult other) {
    failures_.insert(failures_.end(),
                     std::make_move_iterator(other.failures_.begin()),
                     std::make_move_iterator(other.failures_.end()));
    return *this;
}

std::string ValidationResult::describe() const {
    if (failures_.empty()) {
        return "OK";
    }
    std::string out;
    for (std::size_t i = 0; i < failures_.size(); ++i) {
        if (i > 0) out += "\n\n----\n\n";
        out += failures_[i].describe();
    }
    return out;
}

Value ValidationResult::to_json() const {
    Value out = Value::array();
    for (const auto& failure : failures_) {
        out.push_back(failure.to_json());
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const ValidationFailure& failure) {
    return os << failure.describe();
}

std::ostream& operator<<(std::ostream& os, const ValidationResult& result) {
    return os << result.describe();
}

} // namespace jsonexpect
