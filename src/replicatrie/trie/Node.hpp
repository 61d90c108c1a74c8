#pragma once

#include "clock/VectorClock.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace RT {

using Json = nlohmann::json;

/**
 * Identifies the write that produced a Container leaf's value.
 *
 * lamport is the leaf version's total() right after that write, so it grows
 * along every causal chain. Concurrent values are ordered by (lamport, replica).
 */
struct WriteStamp {
    std::uint64_t lamport = 0;
    std::string   replica;

    friend auto operator==(WriteStamp const&, WriteStamp const&) -> bool = default;
    friend auto operator<=>(WriteStamp const&, WriteStamp const&) = default;
};

struct Node;
using NodePtr = std::shared_ptr<const Node>;

/**
 * Immutable trie node.
 *
 * Exactly one of:
 * - Branch: children keyed by path segment
 * - Value: plain scalar payload, no causal metadata
 * - Container: scalar payload with a vector clock and the stamp of its last write
 *
 * Nodes are never modified after they are published through a NodePtr; every
 * update builds new nodes along the written path and shares the rest.
 */
struct Node {
    enum class Kind : std::uint8_t {
        Branch,
        Value,
        Container
    };

    using Children = std::map<std::string, NodePtr, std::less<>>;

    struct Branch {
        Children children;
    };

    struct Value {
        Json payload;
    };

    struct Container {
        Json        value;
        VectorClock version;
        WriteStamp  stamp;
    };

    std::variant<Branch, Value, Container> data;

    [[nodiscard]] auto kind() const noexcept -> Kind { return static_cast<Kind>(data.index()); }
    [[nodiscard]] auto isBranch() const noexcept -> bool { return kind() == Kind::Branch; }
    [[nodiscard]] auto isValue() const noexcept -> bool { return kind() == Kind::Value; }
    [[nodiscard]] auto isContainer() const noexcept -> bool { return kind() == Kind::Container; }
    [[nodiscard]] auto isLeaf() const noexcept -> bool { return !isBranch(); }
    // An empty branch: a path that exists but holds no value.
    [[nodiscard]] auto isTombstone() const noexcept -> bool;

    [[nodiscard]] auto branch() const -> Branch const& { return std::get<Branch>(data); }
    [[nodiscard]] auto value() const -> Value const& { return std::get<Value>(data); }
    [[nodiscard]] auto container() const -> Container const& { return std::get<Container>(data); }

    // Child lookup; null when this is a leaf or the segment is missing.
    [[nodiscard]] auto child(std::string_view segment) const -> NodePtr;
};

[[nodiscard]] auto nodeKindToString(Node::Kind kind) -> std::string_view;

[[nodiscard]] auto makeBranch(Node::Children children = {}) -> NodePtr;
[[nodiscard]] auto makeValue(Json payload) -> NodePtr;
[[nodiscard]] auto makeContainer(Json value, VectorClock version, WriteStamp stamp) -> NodePtr;

// Deep structural equality; identical pointers compare equal without descending.
[[nodiscard]] auto equalNodes(NodePtr const& a, NodePtr const& b) -> bool;

} // namespace RT
