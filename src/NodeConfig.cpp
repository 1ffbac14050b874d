/**
 * @file NodeConfig.cpp
 * @brief Implementation of the configuration tree and its resolution rules
 */

#include "jsonexpect/NodeConfig.hpp"

#include <sstream>
#include <vector>

namespace jsonexpect {

std::string option_name(Option option) {
    switch (option) {
        case Option::AnyOrder:        return "anyOrder";
        case Option::ExactMatch:      return "exactMatch";
        case Option::EqualCount:      return "equalCount";
        case Option::KeyMustBeAbsent: return "keyMustBeAbsent";
        case Option::ValueNotEqual:   return "valueNotEqual";
    }
    return "unknown";
}

std::string scope_name(Scope scope) {
    return scope == Scope::Subtree ? "Tree" : "Node";
}

// ============================================================================
// Defaults
// ============================================================================

bool Defaults::get(Option option) const noexcept {
    switch (option) {
        case Option::AnyOrder:        return any_order;
        case Option::ExactMatch:      return exact_match;
        case Option::EqualCount:      return equal_count;
        case Option::KeyMustBeAbsent: return key_must_be_absent;
        case Option::ValueNotEqual:   return value_not_equal;
    }
    return false;
}

void Defaults::set(Option option, bool value) noexcept {
    switch (option) {
        case Option::AnyOrder:        any_order = value; break;
        case Option::ExactMatch:      exact_match = value; break;
        case Option::EqualCount:      equal_count = value; break;
        case Option::KeyMustBeAbsent: key_must_be_absent = value; break;
        case Option::ValueNotEqual:   value_not_equal = value; break;
    }
}

bool Defaults::operator==(const Defaults& other) const noexcept {
    return any_order == other.any_order &&
           exact_match == other.exact_match &&
           equal_count == other.equal_count &&
           key_must_be_absent == other.key_must_be_absent &&
           value_not_equal == other.value_not_equal;
}

// ============================================================================
// ResolvedNode
// ============================================================================

namespace {
    constexpr Option kAllOptions[] = {
        Option::AnyOrder,
        Option::ExactMatch,
        Option::EqualCount,
        Option::KeyMustBeAbsent,
        Option::ValueNotEqual
    };
}

ResolvedNode ResolvedNode::root(const NodeConfig& config) {
    ResolvedNode node;
    node.name_ = config.name();
    node.any_order_ = config.resolved(Option::AnyOrder);
    node.exact_match_ = config.resolved(Option::ExactMatch);
    node.equal_count_ = config.resolved(Option::EqualCount);
    node.key_must_be_absent_ = config.resolved(Option::KeyMustBeAbsent);
    node.value_not_equal_ = config.resolved(Option::ValueNotEqual);
    node.element_count_ = config.element_count();
    node.defaults_ = config.defaults();
    node.children_ = &config.children();
    node.wildcard_ = config.wildcard();
    return node;
}

bool ResolvedNode::get(Option option) const noexcept {
    switch (option) {
        case Option::AnyOrder:        return any_order_;
        case Option::ExactMatch:      return exact_match_;
        case Option::EqualCount:      return equal_count_;
        case Option::KeyMustBeAbsent: return key_must_be_absent_;
        case Option::ValueNotEqual:   return value_not_equal_;
    }
    return false;
}

ResolvedNode ResolvedNode::resolve(const std::string& name,
                                   const Defaults& parent_defaults,
                                   const std::map<std::string, NodeConfig>* parent_children,
                                   const NodeConfig* parent_wildcard) {
    const NodeConfig* specific = nullptr;
    if (parent_children != nullptr) {
        auto it = parent_children->find(name);
        if (it != parent_children->end()) {
            specific = &it->second;
        }
    }

    ResolvedNode node;
    node.name_ = name;

    if (specific != nullptr) {
        node.defaults_ = specific->defaults();
    } else if (parent_wildcard != nullptr) {
        node.defaults_ = parent_wildcard->defaults();
    } else {
        node.defaults_ = parent_defaults;
    }

    // Structure continues from the specific child, else from the wildcard.
    if (specific != nullptr) {
        node.children_ = &specific->children();
    } else if (parent_wildcard != nullptr) {
        node.children_ = &parent_wildcard->children();
    }

    if (specific != nullptr && specific->wildcard() != nullptr) {
        node.wildcard_ = specific->wildcard();
    } else if (parent_wildcard != nullptr) {
        node.wildcard_ = parent_wildcard->wildcard();
    }

    // Per option: child override, then wildcard override, then defaults.
    // The parent's own overrides are never consulted.
    for (Option option : kAllOptions) {
        std::optional<bool> value;
        if (specific != nullptr) {
            value = specific->override_of(option);
        }
        if (!value.has_value() && parent_wildcard != nullptr) {
            value = parent_wildcard->override_of(option);
        }
        bool resolved = value.value_or(node.defaults_.get(option));
        switch (option) {
            case Option::AnyOrder:        node.any_order_ = resolved; break;
            case Option::ExactMatch:      node.exact_match_ = resolved; break;
            case Option::EqualCount:      node.equal_count_ = resolved; break;
            case Option::KeyMustBeAbsent: node.key_must_be_absent_ = resolved; break;
            case Option::ValueNotEqual:   node.value_not_equal_ = resolved; break;
        }
    }

    // Element count: only from the child or the wildcard, never the parent.
    if (specific != nullptr && specific->element_count().has_value()) {
        node.element_count_ = specific->element_count();
    } else if (parent_wildcard != nullptr) {
        node.element_count_ = parent_wildcard->element_count();
    }

    return node;
}

ResolvedNode ResolvedNode::resolved_child(const std::string& name) const {
    return resolve(name, defaults_, children_, wildcard_);
}

ResolvedNode ResolvedNode::resolved_child(std::size_t index) const {
    return resolved_child(std::to_string(index));
}

// ============================================================================
// NodeConfig - construction
// ============================================================================

NodeConfig::NodeConfig(std::optional<std::string> name, Defaults defaults)
    : name_(std::move(name))
    , defaults_(defaults)
{}

NodeConfig::NodeConfig(const NodeConfig& other)
    : name_(other.name_)
    , any_order_(other.any_order_)
    , exact_match_(other.exact_match_)
    , equal_count_(other.equal_count_)
    , key_must_be_absent_(other.key_must_be_absent_)
    , value_not_equal_(other.value_not_equal_)
    , element_count_(other.element_count_)
    , defaults_(other.defaults_)
    , children_(other.children_)
    , wildcard_(other.wildcard_ ? std::make_unique<NodeConfig>(*other.wildcard_) : nullptr)
{}

NodeConfig& NodeConfig::operator=(const NodeConfig& other) {
    if (this != &other) {
        NodeConfig copy(other);
        *this = std::move(copy);
    }
    return *this;
}

NodeConfig::~NodeConfig() = default;

// ============================================================================
// NodeConfig - overrides
// ============================================================================

std::optional<bool> NodeConfig::override_of(Option option) const noexcept {
    switch (option) {
        case Option::AnyOrder:        return any_order_;
        case Option::ExactMatch:      return exact_match_;
        case Option::EqualCount:      return equal_count_;
        case Option::KeyMustBeAbsent: return key_must_be_absent_;
        case Option::ValueNotEqual:   return value_not_equal_;
    }
    return std::nullopt;
}

void NodeConfig::set_override(Option option, std::optional<bool> value) noexcept {
    switch (option) {
        case Option::AnyOrder:        any_order_ = value; break;
        case Option::ExactMatch:      exact_match_ = value; break;
        case Option::EqualCount:      equal_count_ = value; break;
        case Option::KeyMustBeAbsent: key_must_be_absent_ = value; break;
        case Option::ValueNotEqual:   value_not_equal_ = value; break;
    }
}

bool NodeConfig::resolved(Option option) const noexcept {
    return override_of(option).value_or(defaults_.get(option));
}

// ============================================================================
// NodeConfig - children
// ============================================================================

const NodeConfig* NodeConfig::child(const std::string& name) const {
    auto it = children_.find(name);
    return it == children_.end() ? nullptr : &it->second;
}

const NodeConfig* NodeConfig::child(std::size_t index) const {
    return child(std::to_string(index));
}

void NodeConfig::put_child(const std::string& name, NodeConfig node) {
    children_.insert_or_assign(name, std::move(node));
}

void NodeConfig::set_wildcard(NodeConfig node) {
    wildcard_ = std::make_unique<NodeConfig>(std::move(node));
}

ResolvedNode NodeConfig::resolved_child(const std::string& name) const {
    return ResolvedNode::resolve(name, defaults_, &children_, wildcard_.get());
}

ResolvedNode NodeConfig::resolved_child(std::size_t index) const {
    return resolved_child(std::to_string(index));
}

// ============================================================================
// NodeConfig - mutation by path
// ============================================================================

void NodeConfig::set_option(Option option, bool value, const Path& path, Scope scope) {
    navigate(path.components(), 0, [option, value, scope](NodeConfig& node) {
        if (scope == Scope::SingleNode) {
            node.set_override(option, value);
        } else {
            node.defaults_.set(option, value);
            node.propagate_defaults();
        }
    });
}

void NodeConfig::set_element_count(std::size_t count, const Path& path) {
    navigate(path.components(), 0, [count](NodeConfig& node) {
        node.element_count_ = count;
    });
}

void NodeConfig::navigate(const std::vector<Component>& components, std::size_t pos,
                          const Mutation& apply) {
    if (pos == components.size()) {
        apply(*this);
        return;
    }

    const Component& component = components[pos];

    if (component.is_wildcard()) {
        if (!wildcard_) {
            wildcard_ = std::make_unique<NodeConfig>(component.node_name(), defaults_);
        }
        wildcard_->navigate(components, pos + 1, apply);

        // Retroactively apply to children materialized before the wildcard.
        for (auto& entry : children_) {
            entry.second.navigate(components, pos + 1, apply);
        }
    } else {
        ensure_child(component.node_name()).navigate(components, pos + 1, apply);
    }
}

NodeConfig& NodeConfig::ensure_child(const std::string& name) {
    auto it = children_.find(name);
    if (it != children_.end()) {
        return it->second;
    }

    if (wildcard_) {
        // Seed from the wildcard template (a copy, not a shared reference).
        NodeConfig seeded(*wildcard_);
        seeded.name_ = name;
        return children_.emplace(name, std::move(seeded)).first->second;
    }
    return children_.emplace(name, NodeConfig(name, defaults_)).first->second;
}

void NodeConfig::propagate_defaults() {
    if (wildcard_) {
        wildcard_->defaults_ = defaults_;
        wildcard_->propagate_defaults();
    }
    for (auto& entry : children_) {
        entry.second.defaults_ = defaults_;
        entry.second.propagate_defaults();
    }
}

// ============================================================================
// NodeConfig - diagnostics
// ============================================================================

std::string NodeConfig::describe() const {
    std::string out;
    describe_into(out, 0);
    return out;
}

void NodeConfig::describe_into(std::string& out, int indentation) const {
    const std::string indent(static_cast<std::size_t>(indentation) * 2, ' ');

    out += indent + "Name: " + (name_ ? *name_ : std::string("<Unnamed>")) + "\n";

    std::vector<std::string> active;
    for (Option option : kAllOptions) {
        if (resolved(option)) active.push_back(option_name(option));
    }
    if (element_count_) {
        active.push_back("elementCount(" + std::to_string(*element_count_) + ")");
    }

    if (active.empty()) {
        out += indent + "Options: (defaults)\n";
    } else {
        std::ostringstream oss;
        for (std::size_t i = 0; i < active.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << active[i];
        }
        out += indent + "Options: " + oss.str() + "\n";
    }

    // std::map already iterates in key order
    if (!children_.empty()) {
        out += indent + "Children:\n";
        for (const auto& entry : children_) {
            entry.second.describe_into(out, indentation + 1);
        }
    }
    if (wildcard_) {
        out += indent + "Wildcard:\n";
        wildcard_->describe_into(out, indentation + 1);
    }
}

} // namespace jsonexpect
