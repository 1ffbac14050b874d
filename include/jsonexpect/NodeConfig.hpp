/**
 * @file NodeConfig.hpp
 * @brief Path-addressed tree of validation options
 *
 * The tree mirrors the shape of the expected document. Every node carries:
 * - per-node overrides: each option is either unset (inherit) or an
 *   explicit true/false; the element count is unset or an integer
 * - a Defaults bundle used for every unset override
 * - named children (object keys, or array indices as decimal strings)
 * - at most one wildcard template standing for "every other key/index"
 *
 * Precedence when resolving a child, per option:
 * 1. the named child's own override
 * 2. the parent's wildcard template override
 * 3. the defaults of the named child, else of the wildcard, else of the parent
 *
 * Scopes:
 * - Scope::SingleNode sets the override of the addressed node only
 * - Scope::Subtree rewrites the Defaults of the addressed node and pushes
 *   them to every existing descendant (wildcards included)
 *
 * The element count never inherits from a parent and has no subtree form.
 */

#ifndef JSONEXPECT_NODE_CONFIG_HPP
#define JSONEXPECT_NODE_CONFIG_HPP

#include "jsonexpect/Path.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace jsonexpect {

/**
 * @brief Boolean options that can be applied at a path
 */
enum class Option {
    AnyOrder,         ///< array elements may match actual elements at any position
    ExactMatch,       ///< primitives must be equal (false: same type is enough)
    EqualCount,       ///< collections must have the same number of entries
    KeyMustBeAbsent,  ///< the key must not exist in the actual document
    ValueNotEqual     ///< expected and actual values must differ
};

/**
 * @brief Reach of an option application
 */
enum class Scope {
    SingleNode,  ///< only the addressed node
    Subtree      ///< the addressed node and all of its descendants
};

std::string option_name(Option option);
std::string scope_name(Scope scope);

/**
 * @brief Inherited option values
 *
 * The root starts with {anyOrder=false, exactMatch=true, equalCount=false,
 * keyMustBeAbsent=false, valueNotEqual=false}.
 */
struct Defaults {
    bool any_order = false;
    bool exact_match = true;
    bool equal_count = false;
    bool key_must_be_absent = false;
    bool value_not_equal = false;

    bool get(Option option) const noexcept;
    void set(Option option, bool value) noexcept;

    bool operator==(const Defaults& other) const noexcept;
    bool operator!=(const Defaults& other) const noexcept { return !(*this == other); }
};

class NodeConfig;

/**
 * @brief Fully resolved configuration for one position in the document
 *
 * Holds concrete option values and borrows the children and wildcard of the
 * node it was resolved from. A ResolvedNode must not outlive the NodeConfig
 * tree that produced it.
 */
class ResolvedNode {
public:
    /// Resolve the root of a tree: its own overrides over its defaults
    static ResolvedNode root(const NodeConfig& config);

    const std::optional<std::string>& name() const noexcept { return name_; }

    bool is_any_order() const noexcept { return any_order_; }
    bool is_exact_match() const noexcept { return exact_match_; }
    bool is_equal_count() const noexcept { return equal_count_; }
    bool is_key_must_be_absent() const noexcept { return key_must_be_absent_; }
    bool is_value_not_equal() const noexcept { return value_not_equal_; }
    bool get(Option option) const noexcept;

    const std::optional<std::size_t>& element_count() const noexcept { return element_count_; }

    /// Defaults handed down to children that have no opinion of their own
    const Defaults& defaults() const noexcept { return defaults_; }

    ResolvedNode resolved_child(const std::string& name) const;
    ResolvedNode resolved_child(std::size_t index) const;

private:
    friend class NodeConfig;

    ResolvedNode() = default;

    static ResolvedNode resolve(const std::string& name,
                                const Defaults& parent_defaults,
                                const std::map<std::string, NodeConfig>* parent_children,
                                const NodeConfig* parent_wildcard);

    std::optional<std::string> name_;
    bool any_order_ = false;
    bool exact_match_ = true;
    bool equal_count_ = false;
    bool key_must_be_absent_ = false;
    bool value_not_equal_ = false;
    std::optional<std::size_t> element_count_;
    Defaults defaults_;
    const std::map<std::string, NodeConfig>* children_ = nullptr;
    const NodeConfig* wildcard_ = nullptr;
};

/**
 * @brief One node of the configuration tree
 *
 * Example:
 * ```cpp
 * NodeConfig root;
 * root.set_option(Option::AnyOrder, true, Path::parse("items[*]"), Scope::SingleNode);
 * root.set_option(Option::ExactMatch, false, Path::root(), Scope::Subtree);
 *
 * ResolvedNode items0 = root.resolved_child("items").resolved_child(0);
 * items0.is_any_order();   // true (from the wildcard)
 * items0.is_exact_match(); // false (subtree default)
 * ```
 */
class NodeConfig {
public:
    explicit NodeConfig(std::optional<std::string> name = std::nullopt,
                        Defaults defaults = Defaults());

    NodeConfig(const NodeConfig& other);
    NodeConfig& operator=(const NodeConfig& other);
    NodeConfig(NodeConfig&&) = default;
    NodeConfig& operator=(NodeConfig&&) = default;
    ~NodeConfig();

    // ---- identity -----------------------------------------------------------

    const std::optional<std::string>& name() const noexcept { return name_; }
    void set_name(std::optional<std::string> name) { name_ = std::move(name); }

    // ---- per-node overrides -------------------------------------------------

    /// Override for an option; std::nullopt means "inherit from defaults"
    std::optional<bool> override_of(Option option) const noexcept;
    void set_override(Option option, std::optional<bool> value) noexcept;

    const std::optional<std::size_t>& element_count() const noexcept { return element_count_; }
    void set_element_count_override(std::optional<std::size_t> count) noexcept { element_count_ = count; }

    const Defaults& defaults() const noexcept { return defaults_; }
    void set_defaults(const Defaults& defaults) noexcept { defaults_ = defaults; }

    // Resolved accessors for this node: override ?? default
    bool is_any_order() const noexcept { return resolved(Option::AnyOrder); }
    bool is_exact_match() const noexcept { return resolved(Option::ExactMatch); }
    bool is_equal_count() const noexcept { return resolved(Option::EqualCount); }
    bool is_key_must_be_absent() const noexcept { return resolved(Option::KeyMustBeAbsent); }
    bool is_value_not_equal() const noexcept { return resolved(Option::ValueNotEqual); }
    bool resolved(Option option) const noexcept;

    // ---- children -----------------------------------------------------------

    const std::map<std::string, NodeConfig>& children() const noexcept { return children_; }

    /// Named child, or nullptr
    const NodeConfig* child(const std::string& name) const;
    const NodeConfig* child(std::size_t index) const;

    /// Insert or replace a named child as-is (no wildcard seeding)
    void put_child(const std::string& name, NodeConfig node);

    /// Wildcard template, or nullptr
    const NodeConfig* wildcard() const noexcept { return wildcard_.get(); }
    void set_wildcard(NodeConfig node);
    void clear_wildcard() noexcept { wildcard_.reset(); }

    // ---- resolution ---------------------------------------------------------

    ResolvedNode resolved_child(const std::string& name) const;
    ResolvedNode resolved_child(std::size_t index) const;

    // ---- mutation by path ---------------------------------------------------

    /**
     * @brief Apply a boolean option at a path
     *
     * Intermediate nodes are created as needed. A wildcard component applies
     * the change to the wildcard template and to every named child that
     * already exists at that level.
     */
    void set_option(Option option, bool value, const Path& path, Scope scope);

    /// Set the exact element count at a path (single node only)
    void set_element_count(std::size_t count, const Path& path);

    /**
     * @brief Multi-line dump of the tree for diagnostics
     *
     * Children are listed sorted by name, the wildcard last.
     */
    std::string describe() const;

private:
    using Mutation = std::function<void(NodeConfig&)>;

    void navigate(const std::vector<Component>& components, std::size_t pos,
                  const Mutation& apply);
    NodeConfig& ensure_child(const std::string& name);
    void propagate_defaults();
    void describe_into(std::string& out, int indentation) const;

    std::optional<std::string> name_;

    std::optional<bool> any_order_;
    std::optional<bool> exact_match_;
    std::optional<bool> equal_count_;
    std::optional<bool> key_must_be_absent_;
    std::optional<bool> value_not_equal_;
    std::optional<std::size_t> element_count_;

    Defaults defaults_;

    std::map<std::string, NodeConfig> children_;
    std::unique_ptr<NodeConfig> wildcard_;
};

} // namespace jsonexpect

#endif // JSONEXPECT_NODE_CONFIG_HPP
