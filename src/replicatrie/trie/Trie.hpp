#pragma once

#include "core/Error.hpp"
#include "trie/Node.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace RT::Trie {

using Path = std::vector<std::string>;

/*
 * Persistent trie operations.
 *
 * Every write returns a new root; nodes along the written path are rebuilt and
 * every sibling subtree is shared with the input by reference. Inputs are never
 * modified, so older roots stay valid for as long as somebody holds them. A null
 * root is treated as the empty tree.
 */

// The canonical empty tree. Always the same node.
[[nodiscard]] auto empty() -> NodePtr;

// Splits "/a/b/c" into {"a","b","c"}; "/" is the empty path.
[[nodiscard]] auto parsePath(std::string_view text) -> Expected<Path>;
[[nodiscard]] auto pathToString(Path const& path) -> std::string;

[[nodiscard]] auto get(NodePtr const& root, Path const& path) -> NodePtr;
[[nodiscard]] auto resolve(NodePtr const& root, Path const& path) -> Expected<NodePtr>;
[[nodiscard]] auto has(NodePtr const& root, Path const& path) -> bool;
[[nodiscard]] auto valueAt(NodePtr const& root, Path const& path) -> std::optional<Json>;

[[nodiscard]] auto setValue(NodePtr const& root, Path const& path, Json const& payload) -> Expected<NodePtr>;
[[nodiscard]] auto setContainer(NodePtr const& root,
                                Path const& path,
                                Json const& payload,
                                std::string_view replicaId) -> Expected<NodePtr>;
[[nodiscard]] auto updateValue(NodePtr const& root,
                               Path const& path,
                               Json const& payload,
                               std::string_view replicaId) -> Expected<NodePtr>;

// Leaves at and below path become empty branches; the structure stays.
[[nodiscard]] auto removeValue(NodePtr const& root, Path const& path) -> NodePtr;
// Drops the subtree at path and every ancestor left empty by the removal.
[[nodiscard]] auto removePath(NodePtr const& root, Path const& path) -> NodePtr;

} // namespace RT::Trie
