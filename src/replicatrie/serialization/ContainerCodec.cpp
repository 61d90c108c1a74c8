#include "serialization/ContainerCodec.hpp"

#include "log/TaggedLogger.hpp"

#include <utility>

namespace RT::Serialization {
namespace {

[[nodiscard]] auto make_error(std::string_view field, std::string_view detail) -> Error {
    std::string message;
    message.reserve(field.size() + detail.size() + 2);
    message.append(field);
    if (!detail.empty()) {
        message.append(": ");
        message.append(detail);
    }
    return Error{Error::Code::MalformedInput, std::move(message)};
}

[[nodiscard]] auto ensure_object(Json const& json, std::string_view context) -> Expected<void> {
    if (!json.is_object()) {
        return std::unexpected(make_error(context, "must be a JSON object"));
    }
    return {};
}

[[nodiscard]] auto read_string(Json const& json, char const* key) -> Expected<std::string> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_string()) {
            return std::unexpected(make_error(key, "must be a string"));
        }
        return it->get<std::string>();
    }
    return std::unexpected(make_error(key, "is required"));
}

[[nodiscard]] auto read_uint64(Json const& json, char const* key) -> Expected<std::uint64_t> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_number_unsigned()) {
            return std::unexpected(make_error(key, "must be an unsigned integer"));
        }
        return it->get<std::uint64_t>();
    }
    return std::unexpected(make_error(key, "is required"));
}

[[nodiscard]] auto read_scalar(Json const& json, char const* key) -> Expected<Json> {
    if (auto it = json.find(key); it != json.end()) {
        if (it->is_structured() || it->is_binary() || it->is_discarded()) {
            return std::unexpected(make_error(key, "must be a scalar"));
        }
        return *it;
    }
    return std::unexpected(make_error(key, "is required"));
}

[[nodiscard]] auto read_member(Json const& json, char const* key) -> Expected<Json const*> {
    if (auto it = json.find(key); it != json.end()) {
        return &*it;
    }
    return std::unexpected(make_error(key, "is required"));
}

[[nodiscard]] auto stamp_to_json(WriteStamp const& stamp) -> Json {
    return Json{{"lamport", stamp.lamport}, {"replica", stamp.replica}};
}

[[nodiscard]] auto stamp_from_json(Json const& json) -> Expected<WriteStamp> {
    if (auto ensure = ensure_object(json, "stamp"); !ensure) {
        return std::unexpected(ensure.error());
    }
    auto lamport = read_uint64(json, "lamport");
    if (!lamport) {
        return std::unexpected(lamport.error());
    }
    auto replica = read_string(json, "replica");
    if (!replica) {
        return std::unexpected(replica.error());
    }
    return WriteStamp{*lamport, std::move(*replica)};
}

[[nodiscard]] auto branch_from_json(Json const& json) -> Expected<NodePtr> {
    auto children_json = read_member(json, "children");
    if (!children_json) {
        return std::unexpected(children_json.error());
    }
    if (auto ensure = ensure_object(**children_json, "children"); !ensure) {
        return std::unexpected(ensure.error());
    }
    Node::Children children;
    for (auto const& [segment, child_json] : (*children_json)->items()) {
        auto child = nodeFromJson(child_json);
        if (!child) {
            return std::unexpected(child.error());
        }
        children.emplace(segment, std::move(*child));
    }
    return makeBranch(std::move(children));
}

[[nodiscard]] auto container_leaf_from_json(Json const& json) -> Expected<NodePtr> {
    auto value = read_scalar(json, "value");
    if (!value) {
        return std::unexpected(value.error());
    }
    auto version_json = read_member(json, "version");
    if (!version_json) {
        return std::unexpected(version_json.error());
    }
    auto version = clockFromJson(**version_json);
    if (!version) {
        return std::unexpected(version.error());
    }
    auto stamp_json = read_member(json, "stamp");
    if (!stamp_json) {
        return std::unexpected(stamp_json.error());
    }
    auto stamp = stamp_from_json(**stamp_json);
    if (!stamp) {
        return std::unexpected(stamp.error());
    }
    return makeContainer(std::move(*value), std::move(*version), std::move(*stamp));
}

} // namespace

auto clockToJson(VectorClock const& clock) -> Json {
    Json json = Json::object();
    for (auto const& [replica, counter] : clock) {
        json[replica] = counter;
    }
    return json;
}

auto clockFromJson(Json const& json) -> Expected<VectorClock> {
    if (auto ensure = ensure_object(json, "version"); !ensure) {
        return std::unexpected(ensure.error());
    }
    VectorClock::Entries entries;
    for (auto const& [replica, counter] : json.items()) {
        if (!counter.is_number_unsigned()) {
            return std::unexpected(make_error("version." + replica, "must be an unsigned integer"));
        }
        entries.emplace(replica, counter.get<std::uint64_t>());
    }
    return VectorClock{std::move(entries)};
}

auto nodeToJson(NodePtr const& node) -> Json {
    if (!node) {
        return Json{{"type", std::string(kNodeTypeBranch)}, {"children", Json::object()}};
    }
    switch (node->kind()) {
    case Node::Kind::Value:
        return Json{{"type", std::string(kNodeTypeValue)}, {"value", node->value().payload}};
    case Node::Kind::Container: {
        auto const& leaf = node->container();
        return Json{{"type", std::string(kNodeTypeContainer)},
                    {"value", leaf.value},
                    {"version", clockToJson(leaf.version)},
                    {"stamp", stamp_to_json(leaf.stamp)}};
    }
    case Node::Kind::Branch:
        break;
    }
    Json children = Json::object();
    for (auto const& [segment, child] : node->branch().children) {
        children[segment] = nodeToJson(child);
    }
    return Json{{"type", std::string(kNodeTypeBranch)}, {"children", std::move(children)}};
}

auto nodeFromJson(Json const& json) -> Expected<NodePtr> {
    if (auto ensure = ensure_object(json, "node"); !ensure) {
        return std::unexpected(ensure.error());
    }
    auto type = read_string(json, "type");
    if (!type) {
        return std::unexpected(type.error());
    }
    if (*type == kNodeTypeBranch) {
        return branch_from_json(json);
    }
    if (*type == kNodeTypeValue) {
        auto value = read_scalar(json, "value");
        if (!value) {
            return std::unexpected(value.error());
        }
        return makeValue(std::move(*value));
    }
    if (*type == kNodeTypeContainer) {
        return container_leaf_from_json(json);
    }
    return std::unexpected(make_error("type", "unknown node type '" + *type + "'"));
}

auto containerToJson(Container const& container) -> Json {
    return Json{{"id", container.id},
                {"version", clockToJson(container.version)},
                {"root", nodeToJson(container.root)}};
}

auto containerFromJson(Json const& json) -> Expected<Container> {
    if (auto ensure = ensure_object(json, "container"); !ensure) {
        return std::unexpected(ensure.error());
    }
    auto id = read_string(json, "id");
    if (!id) {
        return std::unexpected(id.error());
    }
    if (id->empty()) {
        return std::unexpected(make_error("id", "must not be empty"));
    }
    auto version_json = read_member(json, "version");
    if (!version_json) {
        return std::unexpected(version_json.error());
    }
    auto version = clockFromJson(**version_json);
    if (!version) {
        return std::unexpected(version.error());
    }
    auto root_json = read_member(json, "root");
    if (!root_json) {
        return std::unexpected(root_json.error());
    }
    auto root = nodeFromJson(**root_json);
    if (!root) {
        return std::unexpected(root.error());
    }
    return Container{std::move(*id), std::move(*root), std::move(*version)};
}

auto serializeContainer(Container const& container, int indent) -> Expected<std::string> {
    auto json = containerToJson(container);
    try {
        return json.dump(indent);
    } catch (nlohmann::json::type_error const& error) {
        rt_log(std::string("Failed to serialize container: ") + error.what(), "ContainerCodec", "ERROR");
        return std::unexpected(make_error("container", error.what()));
    }
}

auto deserializeContainer(std::string_view payload) -> Expected<Container> {
    auto json = Json::parse(payload, nullptr, false);
    if (json.is_discarded()) {
        rt_log("Rejected container payload with invalid JSON", "ContainerCodec", "ERROR");
        return std::unexpected(make_error("container", "invalid JSON payload"));
    }
    auto container = containerFromJson(json);
    if (!container) {
        rt_log("Rejected container payload: " + describeError(container.error()), "ContainerCodec", "ERROR");
    }
    return container;
}

} // namespace RT::Serialization
