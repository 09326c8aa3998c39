#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace DS {

/**
 * Immutable state-tree node.
 *
 * A tree is built from shared, read-only nodes. Writers never modify a node
 * once it is reachable from a published root; a transition copies the nodes
 * along each touched path and reuses every untouched branch by reference.
 * Pointer identity is therefore meaningful: two equal NodePtr values denote
 * the same, unchanged subtree.
 */
struct Node;
using NodePtr = std::shared_ptr<const Node>;
using Array   = std::vector<NodePtr>;
using Object  = std::map<std::string, NodePtr, std::less<>>;

enum class NodeKind : std::uint8_t {
    Null = 0,
    Bool,
    Integer,
    Number,
    String,
    Array,
    Object,
};

struct Node {
    using Storage = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object>;

    Storage value;

    [[nodiscard]] auto kind() const noexcept -> NodeKind { return static_cast<NodeKind>(value.index()); }

    [[nodiscard]] auto isNull() const noexcept -> bool { return kind() == NodeKind::Null; }
    [[nodiscard]] auto isArray() const noexcept -> bool { return kind() == NodeKind::Array; }
    [[nodiscard]] auto isObject() const noexcept -> bool { return kind() == NodeKind::Object; }
    [[nodiscard]] auto isComposite() const noexcept -> bool { return isArray() || isObject(); }

    [[nodiscard]] auto asBool() const noexcept -> bool const* { return std::get_if<bool>(&value); }
    [[nodiscard]] auto asInteger() const noexcept -> std::int64_t const* { return std::get_if<std::int64_t>(&value); }
    [[nodiscard]] auto asNumber() const noexcept -> double const* { return std::get_if<double>(&value); }
    [[nodiscard]] auto asString() const noexcept -> std::string const* { return std::get_if<std::string>(&value); }
    [[nodiscard]] auto asArray() const noexcept -> Array const* { return std::get_if<Array>(&value); }
    [[nodiscard]] auto asObject() const noexcept -> Object const* { return std::get_if<Object>(&value); }

    [[nodiscard]] auto asArray() noexcept -> Array* { return std::get_if<Array>(&value); }
    [[nodiscard]] auto asObject() noexcept -> Object* { return std::get_if<Object>(&value); }

    // Direct children; nullptr when absent or when this node is not of the
    // matching composite kind.
    [[nodiscard]] auto child(std::string_view key) const -> NodePtr;
    [[nodiscard]] auto child(std::size_t index) const -> NodePtr;

    [[nodiscard]] static auto null() -> NodePtr;
    [[nodiscard]] static auto boolean(bool v) -> NodePtr;
    [[nodiscard]] static auto integer(std::int64_t v) -> NodePtr;
    [[nodiscard]] static auto number(double v) -> NodePtr;
    [[nodiscard]] static auto string(std::string v) -> NodePtr;
    [[nodiscard]] static auto array(Array items = {}) -> NodePtr;
    [[nodiscard]] static auto object(Object fields = {}) -> NodePtr;
};

[[nodiscard]] auto nodeKindToString(NodeKind kind) -> std::string_view;

// Value equality of two scalar nodes. Kinds must match (Integer 1 != Number 1.0).
[[nodiscard]] auto scalarEquals(Node const& lhs, Node const& rhs) -> bool;

// Structural equality; identical pointers compare equal without descending.
[[nodiscard]] auto deepEquals(NodePtr const& lhs, NodePtr const& rhs) -> bool;

// Number of distinct nodes reachable from root (shared nodes counted once).
[[nodiscard]] auto countUniqueNodes(NodePtr const& root) -> std::size_t;

struct Snapshot {
    NodePtr     root;
    std::size_t generation = 0;

    [[nodiscard]] auto valid() const noexcept -> bool { return static_cast<bool>(root); }
};

} // namespace DS
