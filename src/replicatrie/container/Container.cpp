#include "container/Container.hpp"

#include "codec/ValueCodec.hpp"
#include "log/TaggedLogger.hpp"

#include <utility>

namespace RT {
namespace {

[[nodiscard]] auto successor(Container const& base, NodePtr root) -> Container {
    Container next{base.id, std::move(root), increment(base.version, base.id)};
    rt_log("Container " + next.id + " advanced to " + toString(next.version), "Container");
    return next;
}

[[nodiscard]] auto successor(Container const& base, Expected<NodePtr> root) -> Expected<Container> {
    if (!root) {
        rt_log("Container " + base.id + " write failed: " + describeError(root.error()), "Container", "ERROR");
        return std::unexpected(root.error());
    }
    return successor(base, std::move(*root));
}

} // namespace

auto Container::toValue() const -> std::optional<Json> {
    return Codec::toValue(root);
}

auto Container::setValue(Trie::Path const& path, Json const& payload) const -> Expected<Container> {
    return successor(*this, Trie::setValue(root, path, payload));
}

auto Container::setContainer(Trie::Path const& path, Json const& payload) const -> Expected<Container> {
    return successor(*this, Trie::setContainer(root, path, payload, id));
}

auto Container::updateValue(Trie::Path const& path, Json const& payload) const -> Expected<Container> {
    return successor(*this, Trie::updateValue(root, path, payload, id));
}

auto Container::removeValue(Trie::Path const& path) const -> Container {
    return successor(*this, Trie::removeValue(root, path));
}

auto Container::removePath(Trie::Path const& path) const -> Container {
    return successor(*this, Trie::removePath(root, path));
}

auto Container::sameState(Container const& other) const -> bool {
    return version == other.version && equalNodes(root, other.root);
}

auto operator==(Container const& lhs, Container const& rhs) -> bool {
    return lhs.id == rhs.id && lhs.sameState(rhs);
}

auto createContainer(std::string_view id) -> Container {
    std::string owner{id};
    VectorClock version{{owner, 0}};
    return Container{std::move(owner), Trie::empty(), std::move(version)};
}

auto mergeContainers(Container const& existing,
                     Container const& incoming,
                     MergeOptions const& options,
                     MergeReport* report) -> Container {
    if (existing.id == incoming.id) {
        switch (compare(existing.version, incoming.version)) {
        case ClockOrdering::Before:
            return incoming;
        case ClockOrdering::After:
            return existing;
        case ClockOrdering::Equal:
            if (equalNodes(existing.root, incoming.root)) {
                return existing;
            }
            rt_log("Replica " + existing.id + " forked at an equal version; merging structurally", "Container",
                   "WARNING");
            break;
        case ClockOrdering::Concurrent:
            rt_log("Replica " + existing.id + " forked; merging structurally", "Container", "WARNING");
            break;
        }
    }

    Container merged{existing.id,
                     mergeTries(existing.root, incoming.root, options, report),
                     merge(existing.version, incoming.version)};
    rt_log("Merged " + incoming.id + " into " + existing.id + " at " + toString(merged.version), "Container");
    return merged;
}

} // namespace RT
