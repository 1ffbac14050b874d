/**
 * @file Rules.cpp
 * @brief Implementation of rule parsing and application
 */

#include "jsonexpect/Rules.hpp"
#include "jsonexpect/Errors.hpp"
#include "jsonexpect/Loader.hpp"

#include <cstdint>
#include <set>

namespace jsonexpect {

namespace {

    struct KindEntry {
        RuleKind kind;
        const char* name;
    };

    constexpr KindEntry kKinds[] = {
        {RuleKind::AnyOrder,        "any-order"},
        {RuleKind::StrictOrder,     "strict-order"},
        {RuleKind::EqualCount,      "equal-count"},
        {RuleKind::FlexibleCount,   "flexible-count"},
        {RuleKind::ElementCount,    "element-count"},
        {RuleKind::ExactMatch,      "exact-match"},
        {RuleKind::TypeMatch,       "type-match"},
        {RuleKind::KeyMustBeAbsent, "key-must-be-absent"},
        {RuleKind::ValueNotEqual,   "value-not-equal"},
    };

    const std::set<std::string> kKnownFields = {"option", "paths", "scope", "count"};

    bool is_node_only(RuleKind kind) {
        return kind == RuleKind::ElementCount || kind == RuleKind::KeyMustBeAbsent;
    }

    std::vector<Path> parse_paths(const Value& paths, int index) {
        std::vector<Path> result;
        if (paths.is_string()) {
            result.push_back(parse_rule_path(paths.get<std::string>()));
            return result;
        }
        if (!paths.is_array()) {
            throw RuleError(index, "'paths' must be a string or a list of strings");
        }
        for (const auto& entry : paths) {
            if (!entry.is_string()) {
                throw RuleError(index, "'paths' entries must be strings, got " + type_name(entry));
            }
            result.push_back(parse_rule_path(entry.get<std::string>()));
        }
        return result;
    }

    std::size_t parse_count(const Value& count, int index) {
        if (count.is_number_unsigned()) {
            return count.get<std::size_t>();
        }
        if (count.is_number_integer() && count.get<std::int64_t>() >= 0) {
            return static_cast<std::size_t>(count.get<std::int64_t>());
        }
        throw RuleError(index, "'count' must be a non-negative integer, got " + render(count));
    }

    Rule parse_rule(const Value& entry, int index) {
        if (!entry.is_object()) {
            throw RuleError(index, "expected a table, got " + type_name(entry));
        }

        for (auto it = entry.begin(); it != entry.end(); ++it) {
            if (kKnownFields.count(it.key()) == 0) {
                throw RuleError(index, "unknown field '" + it.key() + "'");
            }
        }

        auto option = entry.find("option");
        if (option == entry.end() || !option->is_string()) {
            throw RuleError(index, "missing string field 'option'");
        }
        auto kind = rule_kind_from_name(option->get<std::string>());
        if (!kind) {
            throw RuleError(index, "unknown option '" + option->get<std::string>() + "'");
        }

        Rule rule;
        rule.kind = *kind;

        auto paths = entry.find("paths");
        if (paths != entry.end()) {
            rule.paths = parse_paths(*paths, index);
        }

        auto scope = entry.find("scope");
        if (scope != entry.end()) {
            if (!scope->is_string()) {
                throw RuleError(index, "'scope' must be \"node\" or \"subtree\"");
            }
            const std::string name = scope->get<std::string>();
            if (name == "node") {
                rule.scope = Scope::SingleNode;
            } else if (name == "subtree") {
                rule.scope = Scope::Subtree;
            } else {
                throw RuleError(index, "unknown scope '" + name + "'");
            }
        }
        if (rule.scope == Scope::Subtree && is_node_only(rule.kind)) {
            throw RuleError(index, "option '" + rule_kind_name(rule.kind) +
                                   "' does not support subtree scope");
        }

        auto count = entry.find("count");
        if (rule.kind == RuleKind::ElementCount) {
            if (count == entry.end()) {
                throw RuleError(index, "element-count requires 'count'");
            }
            rule.count = parse_count(*count, index);
        } else if (count != entry.end()) {
            throw RuleError(index, "'count' is only valid for element-count");
        }

        return rule;
    }

} // anonymous namespace

std::string rule_kind_name(RuleKind kind) {
    for (const auto& entry : kKinds) {
        if (entry.kind == kind) return entry.name;
    }
    return "unknown";
}

std::optional<RuleKind> rule_kind_from_name(const std::string& name) {
    for (const auto& entry : kKinds) {
        if (name == entry.name) return entry.kind;
    }
    return std::nullopt;
}

Path parse_rule_path(const std::string& text) {
    if (text == "$") {
        return Path::root();
    }
    return Path::parse(text);
}

std::vector<Rule> parse_rules(const Value& document) {
    if (!document.is_object()) {
        throw RuleError(-1, "expected a document with a 'rule' list, got " + type_name(document));
    }
    auto list = document.find("rule");
    if (list == document.end()) {
        throw RuleError(-1, "missing 'rule' list");
    }
    if (!list->is_array()) {
        throw RuleError(-1, "'rule' must be a list, got " + type_name(*list));
    }

    std::vector<Rule> rules;
    rules.reserve(list->size());
    int index = 0;
    for (const auto& entry : *list) {
        rules.push_back(parse_rule(entry, index));
        ++index;
    }
    return rules;
}

std::vector<Rule> load_rules_file(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".toml") {
        return parse_rules(load_toml_file(path));
    }
    return parse_rules(load_json_file(path));
}

JsonAssertion& apply_rule(JsonAssertion& assertion, const Rule& rule) {
    switch (rule.kind) {
        case RuleKind::AnyOrder:        return assertion.any_order(rule.paths, rule.scope);
        case RuleKind::StrictOrder:     return assertion.strict_order(rule.paths, rule.scope);
        case RuleKind::EqualCount:      return assertion.equal_count(rule.paths, rule.scope);
        case RuleKind::FlexibleCount:   return assertion.flexible_count(rule.paths, rule.scope);
        case RuleKind::ElementCount:    return assertion.element_count(rule.count, rule.paths);
        case RuleKind::ExactMatch:      return assertion.exact_match(rule.paths, rule.scope);
        case RuleKind::TypeMatch:       return assertion.type_match(rule.paths, rule.scope);
        case RuleKind::KeyMustBeAbsent: return assertion.key_must_be_absent(rule.paths);
        case RuleKind::ValueNotEqual:   return assertion.value_not_equal(rule.paths, rule.scope);
    }
    return assertion;
}

JsonAssertion& apply_rules(JsonAssertion& assertion, const std::vector<Rule>& rules) {
    for (const auto& rule : rules) {
        apply_rule(assertion, rule);
    }
    return assertion;
}

} // namespace jsonexpect
