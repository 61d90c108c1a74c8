#pragma once

#include "trie/Node.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace RT::Codec {

enum class ValueShape {
    Scalar,
    Sequence,
    Record
};

[[nodiscard]] auto classify(Json const& value) -> ValueShape;
[[nodiscard]] auto valueShapeToString(ValueShape shape) -> std::string_view;

using LeafFactory = std::function<NodePtr(Json const& scalar)>;

/**
 * Decomposes a json value into a trie subtree.
 *
 * Sequences become branches keyed "0".."n-1", records become branches keyed by
 * their member names, and every scalar is handed to makeLeaf. Empty sequences
 * and records decompose to an empty branch.
 */
[[nodiscard]] auto decompose(Json const& value, LeafFactory const& makeLeaf) -> NodePtr;

// Decomposition with plain Value leaves.
[[nodiscard]] auto decomposeValue(Json const& value) -> NodePtr;

/**
 * Rebuilds the json value stored under node.
 *
 * Branch children that rebuild to nothing are omitted. A branch whose surviving
 * segments are exactly "0".."n-1" becomes an array, otherwise an object; a
 * branch with nothing left yields std::nullopt.
 */
[[nodiscard]] auto toValue(NodePtr const& node) -> std::optional<Json>;

[[nodiscard]] auto indexSegment(std::size_t index) -> std::string;
// Canonical decimal index: digits only, no leading zero unless exactly "0".
[[nodiscard]] auto parseIndexSegment(std::string_view segment) -> std::optional<std::size_t>;

} // namespace RT::Codec
