/**
 * @file Convert.hpp
 * @brief Conversion of external representations into Value
 *
 * The engine only ever sees Value. Everything else (raw text, string maps,
 * request bodies, TOML documents) goes through these adapters first.
 * None of them throw for malformed input: text that is not JSON becomes a
 * string leaf, and a request body that is not a JSON object becomes absent.
 */

#ifndef JSONEXPECT_CONVERT_HPP
#define JSONEXPECT_CONVERT_HPP

#include "jsonexpect/Value.hpp"

#include <toml++/toml.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace jsonexpect {

/**
 * @brief Strict JSON parse
 * @return Parsed value, or std::nullopt if text is not valid JSON
 */
std::optional<Value> parse_json(std::string_view text);

/**
 * @brief Convert text to a Value
 *
 * Text that parses as JSON yields the parsed value, anything else is kept
 * as a raw string leaf.
 *
 * Examples:
 * ```cpp
 * to_value("{\"a\": 1}")  // → {"a": 1}
 * to_value("[1, 2]")      // → [1, 2]
 * to_value("42")          // → 42
 * to_value("\"quoted\"")  // → "quoted"
 * to_value("hello")       // → "hello"
 * to_value("")            // → ""
 * ```
 */
Value to_value(std::string_view text);

/// Overload so string literals do not convert to Value implicitly
inline Value to_value(const char* text) {
    return to_value(std::string_view(text));
}

inline Value to_value(const std::string& text) {
    return to_value(std::string_view(text));
}

/// Identity
inline const Value& to_value(const Value& value) {
    return value;
}

/// String-keyed mapping to object, keys in map order
Value to_value(const std::map<std::string, Value>& mapping);

/// Absent stays absent
template <typename T>
std::optional<Value> to_value(const std::optional<T>& value) {
    if (!value) {
        return std::nullopt;
    }
    return Value(to_value(*value));
}

/**
 * @brief Convert an HTTP request body to a Value
 *
 * @return The parsed body if it is a JSON object, std::nullopt for an empty
 *         body, invalid JSON, or any non-object JSON value
 */
std::optional<Value> request_payload_to_value(std::string_view body);

/**
 * @brief Convert a TOML node to a Value
 *
 * Tables become objects, arrays become arrays, and
 * scalars map to their JSON counterparts. Dates, times and date-times are
 * rendered as strings.
 */
Value toml_to_value(const toml::node& node);

} // namespace jsonexpect

#endif // JSONEXPECT_CONVERT_HPP
