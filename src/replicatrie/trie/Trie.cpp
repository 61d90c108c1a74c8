#include "trie/Trie.hpp"

#include "codec/ValueCodec.hpp"

#include <functional>
#include <utility>

namespace RT::Trie {
namespace {

using WriteFn = std::function<Expected<NodePtr>(NodePtr const& existing)>;

[[nodiscard]] auto prefixString(Path const& path, std::size_t depth) -> std::string {
    return pathToString(Path(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(depth)));
}

[[nodiscard]] auto throughLeaf(Path const& path, std::size_t depth, Node const& leaf) -> Error {
    return Error{Error::Code::PathThroughLeaf,
                 "cannot descend through " + std::string(nodeKindToString(leaf.kind())) + " leaf at "
                     + prefixString(path, depth)};
}

/*
 * Rebuilds the chain of branches from node down to path[depth..] and hands the
 * node found at the end of the path (possibly null) to write. Missing branches
 * along the way are created; siblings are reused as-is.
 */
auto writeAt(NodePtr const& node, Path const& path, std::size_t depth, WriteFn const& write)
    -> Expected<NodePtr> {
    if (depth >= path.size()) {
        return write(node);
    }
    if (node && node->isLeaf()) {
        return std::unexpected(throughLeaf(path, depth, *node));
    }

    Node::Children children;
    if (node) {
        children = node->branch().children;
    }
    auto const& key = path[depth];

    NodePtr child;
    if (auto it = children.find(key); it != children.end()) {
        child = it->second;
    }

    auto updatedChild = writeAt(child, path, depth + 1, write);
    if (!updatedChild) {
        return std::unexpected(updatedChild.error());
    }
    children[key] = std::move(*updatedChild);
    return makeBranch(std::move(children));
}

[[nodiscard]] auto freshContainer(Json const& scalar, std::string_view replicaId) -> NodePtr {
    std::string replica{replicaId};
    return makeContainer(scalar, VectorClock{{replica, 1}}, WriteStamp{1, replica});
}

[[nodiscard]] auto containerFactory(std::string_view replicaId) -> Codec::LeafFactory {
    return [replica = std::string(replicaId)](Json const& scalar) { return freshContainer(scalar, replica); };
}

auto updateNode(NodePtr const& existing,
                Json const& payload,
                std::string_view replicaId,
                Path& at) -> Expected<NodePtr> {
    bool const absent = !existing || existing->isTombstone();

    if (Codec::classify(payload) == Codec::ValueShape::Scalar) {
        if (absent) {
            return freshContainer(payload, replicaId);
        }
        if (existing->isContainer()) {
            auto const& current = existing->container();
            auto        version = increment(current.version, replicaId);
            auto        lamport = version.total();
            return makeContainer(payload, std::move(version), WriteStamp{lamport, std::string(replicaId)});
        }
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     "cannot update " + std::string(nodeKindToString(existing->kind()))
                                         + " at " + pathToString(at) + " with a scalar"});
    }

    if (!absent && existing->isLeaf()) {
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     "cannot update " + std::string(nodeKindToString(existing->kind()))
                                         + " at " + pathToString(at) + " with a compound value"});
    }

    Node::Children children;
    if (existing) {
        children = existing->branch().children;
    }
    auto apply = [&](std::string segment, Json const& element) -> Expected<void> {
        NodePtr current;
        if (auto it = children.find(segment); it != children.end()) {
            current = it->second;
        }
        at.push_back(segment);
        auto updated = updateNode(current, element, replicaId, at);
        at.pop_back();
        if (!updated) {
            return std::unexpected(updated.error());
        }
        children[std::move(segment)] = std::move(*updated);
        return {};
    };

    if (payload.is_array()) {
        std::size_t index = 0;
        for (auto const& element : payload) {
            if (auto result = apply(Codec::indexSegment(index++), element); !result) {
                return std::unexpected(result.error());
            }
        }
    } else {
        for (auto const& [key, element] : payload.items()) {
            if (auto result = apply(key, element); !result) {
                return std::unexpected(result.error());
            }
        }
    }
    return makeBranch(std::move(children));
}

// Replaces every leaf under node with an empty branch, keeping the shape.
auto tombstoneSubtree(NodePtr const& node) -> NodePtr {
    if (node->isLeaf()) {
        return makeBranch();
    }
    auto const& original = node->branch().children;
    Node::Children children;
    bool           changed = false;
    for (auto const& [segment, child] : original) {
        auto cleared = tombstoneSubtree(child);
        changed      = changed || cleared.get() != child.get();
        children.emplace(segment, std::move(cleared));
    }
    if (!changed) {
        return node;
    }
    return makeBranch(std::move(children));
}

// Returns null when node itself should disappear.
auto pruneAt(NodePtr const& node, Path const& path, std::size_t depth) -> NodePtr {
    if (depth >= path.size()) {
        return {};
    }
    Node::Children children = node->branch().children;
    auto           it       = children.find(path[depth]);
    auto           updated  = pruneAt(it->second, path, depth + 1);
    if (updated) {
        it->second = std::move(updated);
    } else {
        children.erase(it);
    }
    if (children.empty()) {
        return {};
    }
    return makeBranch(std::move(children));
}

} // namespace

auto empty() -> NodePtr {
    static NodePtr const instance = makeBranch();
    return instance;
}

auto parsePath(std::string_view text) -> Expected<Path> {
    if (text.empty() || text.front() != '/') {
        return std::unexpected(Error{Error::Code::InvalidPath, "path must start with '/'"});
    }
    Path components;
    if (text.size() == 1) {
        return components;
    }
    std::size_t start = 1; // skip leading '/'
    for (std::size_t i = 1; i <= text.size(); ++i) {
        if (i == text.size() || text[i] == '/') {
            if (i == start) {
                return std::unexpected(Error{Error::Code::InvalidPath, "empty path component"});
            }
            components.emplace_back(text.substr(start, i - start));
            start = i + 1;
        }
    }
    return components;
}

auto pathToString(Path const& path) -> std::string {
    if (path.empty()) {
        return "/";
    }
    std::string text;
    for (auto const& segment : path) {
        text.push_back('/');
        text.append(segment);
    }
    return text;
}

auto get(NodePtr const& root, Path const& path) -> NodePtr {
    NodePtr node = root ? root : empty();
    for (auto const& segment : path) {
        node = node->child(segment);
        if (!node) {
            return {};
        }
    }
    return node;
}

auto resolve(NodePtr const& root, Path const& path) -> Expected<NodePtr> {
    NodePtr node = root ? root : empty();
    for (std::size_t depth = 0; depth < path.size(); ++depth) {
        if (node->isLeaf()) {
            return std::unexpected(throughLeaf(path, depth, *node));
        }
        auto next = node->child(path[depth]);
        if (!next) {
            return std::unexpected(Error{Error::Code::NoSuchPath, prefixString(path, depth + 1)});
        }
        node = std::move(next);
    }
    return node;
}

auto has(NodePtr const& root, Path const& path) -> bool {
    if (path.empty()) {
        return root && !root->isTombstone();
    }
    return static_cast<bool>(get(root, path));
}

auto valueAt(NodePtr const& root, Path const& path) -> std::optional<Json> {
    return Codec::toValue(get(root, path));
}

auto setValue(NodePtr const& root, Path const& path, Json const& payload) -> Expected<NodePtr> {
    return writeAt(root ? root : empty(), path, 0, [&](NodePtr const&) -> Expected<NodePtr> {
        return Codec::decomposeValue(payload);
    });
}

auto setContainer(NodePtr const& root, Path const& path, Json const& payload, std::string_view replicaId)
    -> Expected<NodePtr> {
    auto factory = containerFactory(replicaId);
    return writeAt(root ? root : empty(), path, 0, [&](NodePtr const&) -> Expected<NodePtr> {
        return Codec::decompose(payload, factory);
    });
}

auto updateValue(NodePtr const& root, Path const& path, Json const& payload, std::string_view replicaId)
    -> Expected<NodePtr> {
    return writeAt(root ? root : empty(), path, 0, [&](NodePtr const& existing) -> Expected<NodePtr> {
        Path at = path;
        return updateNode(existing, payload, replicaId, at);
    });
}

auto removeValue(NodePtr const& root, Path const& path) -> NodePtr {
    NodePtr base   = root ? root : empty();
    auto    target = get(base, path);
    if (!target) {
        return base;
    }
    auto cleared = tombstoneSubtree(target);
    if (cleared.get() == target.get()) {
        return base;
    }
    auto result = writeAt(base, path, 0, [&](NodePtr const&) -> Expected<NodePtr> { return cleared; });
    // The path was just resolved through branches, so the rebuild cannot fail.
    return result ? std::move(*result) : base;
}

auto removePath(NodePtr const& root, Path const& path) -> NodePtr {
    NodePtr base = root ? root : empty();
    if (!get(base, path)) {
        return base;
    }
    auto pruned = pruneAt(base, path, 0);
    return pruned ? pruned : empty();
}

} // namespace RT::Trie
