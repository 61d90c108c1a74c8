#pragma once

#include "container/Container.hpp"
#include "core/Error.hpp"

#include <string>
#include <string_view>

namespace RT::Serialization {

inline constexpr std::string_view kNodeTypeBranch{"branch"};
inline constexpr std::string_view kNodeTypeValue{"value"};
inline constexpr std::string_view kNodeTypeContainer{"container"};

/*
 * Exchange format shipped between replicas:
 *
 *   { "id": string, "version": {replica: uint}, "root": node }
 *
 *   node := { "type": "branch",    "children": {segment: node} }
 *         | { "type": "value",     "value": scalar }
 *         | { "type": "container", "value": scalar, "version": {...},
 *             "stamp": {"lamport": uint, "replica": string} }
 */

[[nodiscard]] auto clockToJson(VectorClock const& clock) -> Json;
[[nodiscard]] auto clockFromJson(Json const& json) -> Expected<VectorClock>;

[[nodiscard]] auto nodeToJson(NodePtr const& node) -> Json;
[[nodiscard]] auto nodeFromJson(Json const& json) -> Expected<NodePtr>;

[[nodiscard]] auto containerToJson(Container const& container) -> Json;
[[nodiscard]] auto containerFromJson(Json const& json) -> Expected<Container>;

// indent < 0 produces compact output.
[[nodiscard]] auto serializeContainer(Container const& container, int indent = -1) -> Expected<std::string>;
[[nodiscard]] auto deserializeContainer(std::string_view payload) -> Expected<Container>;

} // namespace RT::Serialization
