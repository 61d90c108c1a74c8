#include "trie/Node.hpp"

namespace RT {

auto Node::isTombstone() const noexcept -> bool {
    auto const* b = std::get_if<Branch>(&data);
    return b != nullptr && b->children.empty();
}

auto Node::child(std::string_view segment) const -> NodePtr {
    auto const* b = std::get_if<Branch>(&data);
    if (b == nullptr) {
        return {};
    }
    auto it = b->children.find(segment);
    if (it == b->children.end()) {
        return {};
    }
    return it->second;
}

auto nodeKindToString(Node::Kind kind) -> std::string_view {
    switch (kind) {
    case Node::Kind::Branch:
        return "branch";
    case Node::Kind::Value:
        return "value";
    case Node::Kind::Container:
        return "container";
    }
    return "unknown";
}

auto makeBranch(Node::Children children) -> NodePtr {
    return std::make_shared<const Node>(Node{Node::Branch{std::move(children)}});
}

auto makeValue(Json payload) -> NodePtr {
    return std::make_shared<const Node>(Node{Node::Value{std::move(payload)}});
}

auto makeContainer(Json value, VectorClock version, WriteStamp stamp) -> NodePtr {
    return std::make_shared<const Node>(
        Node{Node::Container{std::move(value), std::move(version), std::move(stamp)}});
}

auto equalNodes(NodePtr const& a, NodePtr const& b) -> bool {
    if (a.get() == b.get()) {
        return true;
    }
    if (!a || !b || a->kind() != b->kind()) {
        return false;
    }
    switch (a->kind()) {
    case Node::Kind::Value:
        return a->value().payload == b->value().payload;
    case Node::Kind::Container: {
        auto const& ca = a->container();
        auto const& cb = b->container();
        return ca.value == cb.value && ca.version == cb.version && ca.stamp == cb.stamp;
    }
    case Node::Kind::Branch: {
        auto const& ka = a->branch().children;
        auto const& kb = b->branch().children;
        if (ka.size() != kb.size()) {
            return false;
        }
        auto itB = kb.begin();
        for (auto const& [segment, child] : ka) {
            if (segment != itB->first || !equalNodes(child, itB->second)) {
                return false;
            }
            ++itB;
        }
        return true;
    }
    }
    return false;
}

} // namespace RT
