/**
 * @file Convert.cpp
 * @brief Implementation of Value conversions
 */

#include "jsonexpect/Convert.hpp"

#include <sstream>

namespace jsonexpect {

std::optional<Value> parse_json(std::string_view text) {
    // Non-throwing parse: a syntax error yields a discarded value
    Value parsed = Value::parse(text.begin(), text.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

Value to_value(std::string_view text) {
    if (auto parsed = parse_json(text)) {
        return std::move(*parsed);
    }
    return Value(std::string(text));
}

Value to_value(const std::map<std::string, Value>& mapping) {
    Value obj = Value::object();
    for (const auto& entry : mapping) {
        obj[entry.first] = entry.second;
    }
    return obj;
}

std::optional<Value> request_payload_to_value(std::string_view body) {
    if (body.empty()) {
        return std::nullopt;
    }
    auto parsed = parse_json(body);
    if (!parsed || !parsed->is_object()) {
        return std::nullopt;
    }
    return parsed;
}

namespace {

    template <typename T>
    std::string stream_to_string(const T& value) {
        std::ostringstream ss;
        ss << value;
        return ss.str();
    }

} // anonymous namespace

Value toml_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return Value(stream_to_string(node.as_date()->get()));

        case toml::node_type::time:
            return Value(stream_to_string(node.as_time()->get()));

        case toml::node_type::date_time:
            return Value(stream_to_string(node.as_date_time()->get()));

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_to_value(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // namespace jsonexpect
