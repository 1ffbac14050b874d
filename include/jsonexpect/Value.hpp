/**
 * @file Value.hpp
 * @brief Canonical JSON value used by the comparison engine
 *
 * Uses nlohmann::ordered_json as the underlying value model so object keys
 * keep their insertion order:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef JSONEXPECT_VALUE_HPP
#define JSONEXPECT_VALUE_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace jsonexpect {

/**
 * @brief JSON-like value type compared by the engine
 *
 * Alias for nlohmann::ordered_json. All external representations
 * (strings, maps, TOML documents, request bodies) are converted to this
 * type before they reach the engine (see Convert.hpp).
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Closed classification of a Value used for type matching
 *
 * Signed and unsigned integers share the Integer kind: the JSON parser
 * produces unsigned integers for non-negative literals while initializer
 * lists produce signed ones, and both denote the same JSON type.
 * Integer and Float are distinct kinds, so `1` and `1.0` never type-match.
 */
enum class Kind {
    Null,
    Boolean,
    Integer,
    Float,
    String,
    Array,
    Object
};

/**
 * @brief Classify a value
 */
inline Kind kind_of(const Value& val) {
    switch (val.type()) {
        case Value::value_t::boolean:         return Kind::Boolean;
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned: return Kind::Integer;
        case Value::value_t::number_float:    return Kind::Float;
        case Value::value_t::string:          return Kind::String;
        case Value::value_t::array:           return Kind::Array;
        case Value::value_t::object:          return Kind::Object;
        default:                              return Kind::Null;
    }
}

/**
 * @brief Get human-readable name of a kind
 * @return "null", "boolean", "integer", "float", "string", "array" or "object"
 */
inline std::string kind_name(Kind kind) {
    switch (kind) {
        case Kind::Null:    return "null";
        case Kind::Boolean: return "boolean";
        case Kind::Integer: return "integer";
        case Kind::Float:   return "float";
        case Kind::String:  return "string";
        case Kind::Array:   return "array";
        case Kind::Object:  return "object";
    }
    return "unknown";
}

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    return kind_name(kind_of(val));
}

/**
 * @brief Check if value is a container (array or object)
 * @param val The value to check
 * @return true if val is array or object, false otherwise
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/**
 * @brief Check whether two values have the same JSON type
 */
inline bool same_kind(const Value& a, const Value& b) {
    return kind_of(a) == kind_of(b);
}

/**
 * @brief Deep equality used by value matching
 *
 * Differs from Value::operator== in two places:
 * - A signed and an unsigned integer are equal only if the signed one is
 *   non-negative and both hold the same number.
 * - Object keys are compared regardless of insertion order.
 */
inline bool values_equal(const Value& a, const Value& b) {
    if (a.is_number_integer() && b.is_number_integer() &&
        a.is_number_unsigned() != b.is_number_unsigned()) {
        const Value& signed_value = a.is_number_unsigned() ? b : a;
        const Value& unsigned_value = a.is_number_unsigned() ? a : b;
        const auto s = signed_value.get<std::int64_t>();
        return s >= 0 && static_cast<std::uint64_t>(s) == unsigned_value.get<std::uint64_t>();
    }

    if (a.is_object() && b.is_object()) {
        if (a.size() != b.size()) return false;
        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end() || !values_equal(it.value(), *other)) return false;
        }
        return true;
    }

    if (a.is_array() && b.is_array()) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!values_equal(a[i], b[i])) return false;
        }
        return true;
    }

    return a == b;
}

/**
 * @brief Compact JSON text for diagnostics
 *
 * Invalid UTF-8 in strings is replaced with U+FFFD instead of throwing.
 */
inline std::string render(const Value& val) {
    return val.dump(-1, ' ', false, Value::error_handler_t::replace);
}

} // namespace jsonexpect

#endif // JSONEXPECT_VALUE_HPP
