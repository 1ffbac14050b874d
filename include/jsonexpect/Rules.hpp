/**
 * @file Rules.hpp
 * @brief Option applications described as data
 *
 * A rules document holds a `rule` list. In TOML:
 *
 * ```toml
 * [[rule]]
 * option = "any-order"
 * paths = ["items[*]"]
 *
 * [[rule]]
 * option = "type-match"
 * paths = "items[*].timestamp"
 *
 * [[rule]]
 * option = "type-match"
 * scope = "subtree"          # whole document
 *
 * [[rule]]
 * option = "element-count"
 * paths = "items"
 * count = 3
 * ```
 *
 * The same structure is accepted from JSON: {"rule": [{...}, ...]}.
 *
 * Fields:
 * - option: any-order, strict-order, equal-count, flexible-count,
 *   element-count, exact-match, type-match, key-must-be-absent,
 *   value-not-equal (required)
 * - paths: a path string or a list of them; missing or empty means the
 *   root, and "$" also addresses the root
 * - scope: "node" (default) or "subtree"; element-count and
 *   key-must-be-absent only accept "node"
 * - count: required for element-count, a non-negative integer
 */

#ifndef JSONEXPECT_RULES_HPP
#define JSONEXPECT_RULES_HPP

#include "jsonexpect/Assertion.hpp"
#include "jsonexpect/NodeConfig.hpp"
#include "jsonexpect/Path.hpp"
#include "jsonexpect/Value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace jsonexpect {

/**
 * @brief The option applications a rule can request
 */
enum class RuleKind {
    AnyOrder,
    StrictOrder,
    EqualCount,
    FlexibleCount,
    ElementCount,
    ExactMatch,
    TypeMatch,
    KeyMustBeAbsent,
    ValueNotEqual
};

/// "any-order", "strict-order", ...
std::string rule_kind_name(RuleKind kind);

/// Inverse of rule_kind_name(); std::nullopt for unknown names
std::optional<RuleKind> rule_kind_from_name(const std::string& name);

/**
 * @brief One option application
 */
struct Rule {
    RuleKind kind = RuleKind::ExactMatch;
    std::vector<Path> paths;        ///< Empty means root
    Scope scope = Scope::SingleNode;
    std::size_t count = 0;          ///< ElementCount only
};

/**
 * @brief Parse a path given by a user
 *
 * "$" is the root; anything else goes through Path::parse().
 */
Path parse_rule_path(const std::string& text);

/**
 * @brief Read rules from a parsed JSON/TOML document
 * @throws RuleError if the document or any rule is malformed
 */
std::vector<Rule> parse_rules(const Value& document);

/**
 * @brief Load rules from a .json or .toml file
 * @throws FileNotFoundError, DocumentParseError, RuleError
 */
std::vector<Rule> load_rules_file(const std::string& path);

/// Apply one rule to an assertion
JsonAssertion& apply_rule(JsonAssertion& assertion, const Rule& rule);

/// Apply rules in order
JsonAssertion& apply_rules(JsonAssertion& assertion, const std::vector<Rule>& rules);

} // namespace jsonexpect

#endif // JSONEXPECT_RULES_HPP
