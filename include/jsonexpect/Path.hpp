/**
 * @file Path.hpp
 * @brief Path grammar for addressing locations in a JSON document
 *
 * A Path is an ordered, immutable list of components:
 * - Key("name")    object key           "user.name"
 * - Index(n)       array index          "items[0]", "matrix[0][1]"
 * - WildcardKey    every object key     "data.*"
 * - WildcardIndex  every array element  "items[*]"
 *
 * Escapes inside keys: "\." (literal dot), "\[" and "\]" (literal
 * brackets), "\\" (literal backslash), "\*" (literal asterisk, only
 * needed when the key is "*").
 *
 * Parsing never throws. Bracket content that is neither a non-negative
 * integer nor "*" is dropped; the rest of the path is still parsed.
 * The empty string parses to a single empty key. The root path (no
 * components) is only available as Path::root().
 */

#ifndef JSONEXPECT_PATH_HPP
#define JSONEXPECT_PATH_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace jsonexpect {

/**
 * @brief One step of a Path
 */
class Component {
public:
    enum class Type {
        Key,
        Index,
        WildcardKey,
        WildcardIndex
    };

    static Component key(std::string name);
    static Component index(std::size_t position);
    static Component wildcard_key();
    static Component wildcard_index();

    Type type() const noexcept { return type_; }

    /// Key name; empty for every other type
    const std::string& name() const noexcept { return name_; }

    /// Array position; 0 for every other type
    std::size_t position() const noexcept { return position_; }

    bool is_wildcard() const noexcept {
        return type_ == Type::WildcardKey || type_ == Type::WildcardIndex;
    }

    /// True for Index and WildcardIndex
    bool is_array_access() const noexcept {
        return type_ == Type::Index || type_ == Type::WildcardIndex;
    }

    /**
     * @brief Name of the configuration node this component addresses
     *
     * - Key: the key itself
     * - Index: the decimal index ("0", "42")
     * - WildcardKey: "*"
     * - WildcardIndex: "[*]"
     */
    std::string node_name() const;

    /**
     * @brief Debug form: .key("a"), .index(0), .wildcardKey, .wildcardIndex
     */
    std::string describe() const;

    bool operator==(const Component& other) const noexcept;
    bool operator!=(const Component& other) const noexcept { return !(*this == other); }
    bool operator<(const Component& other) const noexcept;

private:
    Component(Type type, std::string name, std::size_t position)
        : type_(type), name_(std::move(name)), position_(position) {}

    Type type_;
    std::string name_;
    std::size_t position_;
};

/**
 * @brief Location inside a JSON document
 *
 * Examples:
 * ```cpp
 * Path p = Path::parse("users[0].name");
 * // components: .key("users"), .index(0), .key("name")
 *
 * Path q = Path::root()
 *     .appending(Component::key("items"))
 *     .appending(Component::wildcard_index());
 * q.to_string();  // "items[*]"
 * ```
 */
class Path {
public:
    /// The root path (no components)
    Path() = default;

    explicit Path(std::vector<Component> components)
        : components_(std::move(components)) {}

    /// Implicit parse so path strings can be passed wherever a Path is expected
    Path(const std::string& text) : Path(parse(text)) {}
    Path(const char* text) : Path(parse(text)) {}

    static Path root() { return Path(); }

    /**
     * @brief Parse a path string
     *
     * Examples:
     * - "a.b"              -> key(a), key(b)
     * - "items[*].*.id"    -> key(items), wildcardIndex, wildcardKey, key(id)
     * - "user\\.name"      -> key("user.name")
     * - "key\\[0\\]"       -> key("key[0]")
     * - "[0]"              -> index(0)
     * - ""                 -> key("")
     * - "items[abc].id"    -> key(items), key(id)
     */
    static Path parse(const std::string& text);

    const std::vector<Component>& components() const noexcept { return components_; }
    std::size_t size() const noexcept { return components_.size(); }
    bool is_root() const noexcept { return components_.empty(); }

    Path appending(const Component& component) const;
    Path appending(const std::vector<Component>& more) const;
    Path appending(const Path& other) const;

    /// All components but the last; std::nullopt for the root
    std::optional<Path> parent() const;

    /// Last component; std::nullopt for the root
    std::optional<Component> last_component() const;

    /**
     * @brief Path string in the grammar accepted by parse()
     *
     * The root prints as "". An empty key directly followed by an index
     * gets a trailing dot (".[0]") so it is not read back as a root index.
     * For any path built with appending(), parse(to_string()) yields the
     * same components.
     */
    std::string to_string() const;

    /// Like to_string() but prints "<root>" for the root
    std::string describe() const;

    bool operator==(const Path& other) const noexcept { return components_ == other.components_; }
    bool operator!=(const Path& other) const noexcept { return !(*this == other); }
    bool operator<(const Path& other) const noexcept { return components_ < other.components_; }

private:
    std::vector<Component> components_;
};

/// Key name as written in a path string: "a.b" -> "a\.b", "*" -> "\*"
std::string escape_key(const std::string& name);

std::ostream& operator<<(std::ostream& os, const Component& component);
std::ostream& operator<<(std::ostream& os, const Path& path);

} // namespace jsonexpect

#endif // JSONEXPECT_PATH_HPP
