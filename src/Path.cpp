/**
 * @file Path.cpp
 * @brief Implementation of the path grammar
 */

#include "jsonexpect/Path.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <tuple>

namespace jsonexpect {

// ============================================================================
// Component
// ============================================================================

Component Component::key(std::string name) {
    return Component(Type::Key, std::move(name), 0);
}

Component Component::index(std::size_t position) {
    return Component(Type::Index, std::string(), position);
}

Component Component::wildcard_key() {
    return Component(Type::WildcardKey, std::string(), 0);
}

Component Component::wildcard_index() {
    return Component(Type::WildcardIndex, std::string(), 0);
}

std::string Component::node_name() const {
    switch (type_) {
        case Type::Key:           return name_;
        case Type::Index:         return std::to_string(position_);
        case Type::WildcardKey:   return "*";
        case Type::WildcardIndex: return "[*]";
    }
    return name_;
}

std::string Component::describe() const {
    switch (type_) {
        case Type::Key:           return ".key(\"" + name_ + "\")";
        case Type::Index:         return ".index(" + std::to_string(position_) + ")";
        case Type::WildcardKey:   return ".wildcardKey";
        case Type::WildcardIndex: return ".wildcardIndex";
    }
    return std::string();
}

bool Component::operator==(const Component& other) const noexcept {
    return type_ == other.type_ && name_ == other.name_ && position_ == other.position_;
}

bool Component::operator<(const Component& other) const noexcept {
    return std::tie(type_, name_, position_) <
           std::tie(other.type_, other.name_, other.position_);
}

// ============================================================================
// Parsing helpers
// ============================================================================

namespace {
    /**
     * @brief Check whether the character at pos is preceded by an odd
     *        number of backslashes
     */
    bool is_escaped(const std::string& s, std::size_t pos) {
        std::size_t backslashes = 0;
        while (pos > 0 && s[pos - 1] == '\\') {
            ++backslashes;
            --pos;
        }
        return backslashes % 2 != 0;
    }

    /**
     * @brief Split on unescaped dots
     *
     * Escape sequences are kept verbatim so later stages can still tell
     * "\[" from "[".
     *
     * Example: "key0\.key1.key2[1][2].key3" -> ["key0\.key1", "key2[1][2]", "key3"]
     */
    std::vector<std::string> split_object_segments(const std::string& path) {
        std::vector<std::string> segments;
        std::string current;

        for (std::size_t i = 0; i < path.size(); ++i) {
            char c = path[i];
            if (c == '\\') {
                current += c;
                if (i + 1 < path.size()) {
                    current += path[++i];
                }
            } else if (c == '.') {
                segments.push_back(current);
                current.clear();
            } else {
                current += c;
            }
        }
        segments.push_back(current);

        return segments;
    }

    struct SegmentParts {
        std::optional<std::string> key;
        std::vector<std::string> brackets;
    };

    /**
     * @brief Peel the trailing run of bracket groups off a segment
     *
     * Example: "key1[0][1]" -> key "key1", brackets ["[0]", "[1]"]
     *          "[*]"        -> no key,    brackets ["[*]"]
     *          "a[0]b"      -> key "a[0]b"
     */
    SegmentParts split_segment(const std::string& segment) {
        SegmentParts parts;
        std::size_t end = segment.size();

        while (end > 0 && segment[end - 1] == ']' && !is_escaped(segment, end - 1)) {
            int depth = 1;
            std::size_t start = end - 1;
            bool matched = false;
            while (start > 0) {
                --start;
                char c = segment[start];
                if (c == ']' && !is_escaped(segment, start)) {
                    ++depth;
                } else if (c == '[' && !is_escaped(segment, start)) {
                    if (--depth == 0) {
                        matched = true;
                        break;
                    }
                }
            }
            if (!matched) break;

            parts.brackets.insert(parts.brackets.begin(), segment.substr(start, end - start));
            end = start;
        }

        if (parts.brackets.empty() || end > 0) {
            parts.key = segment.substr(0, end);
        }
        return parts;
    }

    std::string unescape_key(const std::string& raw) {
        std::string out;
        out.reserve(raw.size());
        for (std::size_t i = 0; i < raw.size(); ++i) {
            if (raw[i] == '\\' && i + 1 < raw.size()) {
                char next = raw[i + 1];
                if (next == '.' || next == '[' || next == ']' || next == '*' || next == '\\') {
                    out += next;
                    ++i;
                    continue;
                }
            }
            out += raw[i];
        }
        return out;
    }

    /**
     * @brief Parse "[42]" into 42
     * @return std::nullopt for anything but a non-negative decimal integer
     */
    std::optional<std::size_t> parse_array_index(const std::string& group) {
        if (group.size() < 3) return std::nullopt;
        const std::string inner = group.substr(1, group.size() - 2);
        if (!std::all_of(inner.begin(), inner.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::nullopt;
        }

        std::size_t value = 0;
        const char* first = inner.data();
        const char* last = inner.data() + inner.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) {
            return std::nullopt;
        }
        return value;
    }

}

std::string escape_key(const std::string& name) {
    if (name == "*") {
        return "\\*";
    }
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '.' || c == '[' || c == ']' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

// ============================================================================
// Path
// ============================================================================

Path Path::parse(const std::string& text) {
    std::vector<Component> components;

    for (const auto& segment : split_object_segments(text)) {
        SegmentParts parts = split_segment(segment);

        if (parts.key.has_value()) {
            if (*parts.key == "*") {
                components.push_back(Component::wildcard_key());
            } else {
                components.push_back(Component::key(unescape_key(*parts.key)));
            }
        }

        for (const auto& group : parts.brackets) {
            if (group == "[*]") {
                components.push_back(Component::wildcard_index());
            } else if (auto idx = parse_array_index(group)) {
                components.push_back(Component::index(*idx));
            }
            // Anything else inside brackets is dropped.
        }
    }

    return Path(std::move(components));
}

Path Path::appending(const Component& component) const {
    std::vector<Component> next = components_;
    next.push_back(component);
    return Path(std::move(next));
}

Path Path::appending(const std::vector<Component>& more) const {
    std::vector<Component> next = components_;
    next.insert(next.end(), more.begin(), more.end());
    return Path(std::move(next));
}

Path Path::appending(const Path& other) const {
    return appending(other.components_);
}

std::optional<Path> Path::parent() const {
    if (components_.empty()) {
        return std::nullopt;
    }
    return Path(std::vector<Component>(components_.begin(), components_.end() - 1));
}

std::optional<Component> Path::last_component() const {
    if (components_.empty()) {
        return std::nullopt;
    }
    return components_.back();
}

std::string Path::to_string() const {
    std::string result;
    bool first = true;
    for (std::size_t i = 0; i < components_.size(); ++i) {
        const Component& component = components_[i];
        switch (component.type()) {
            case Component::Type::Key:
                if (!first) result += '.';
                result += escape_key(component.name());
                // "[0]" alone would parse as a root index
                if (component.name().empty() && i + 1 < components_.size() &&
                    components_[i + 1].is_array_access()) {
                    result += '.';
                }
                break;
            case Component::Type::Index:
                result += '[' + std::to_string(component.position()) + ']';
                break;
            case Component::Type::WildcardKey:
                if (!first) result += '.';
                result += '*';
                break;
            case Component::Type::WildcardIndex:
                result += "[*]";
                break;
        }
        first = false;
    }
    return result;
}

std::string Path::describe() const {
    if (components_.empty()) {
        return "<root>";
    }
    return to_string();
}

std::ostream& operator<<(std::ostream& os, const Component& component) {
    return os << component.describe();
}

std::ostream& operator<<(std::ostream& os, const Path& path) {
    return os << path.describe();
}

} // namespace jsonexpect
