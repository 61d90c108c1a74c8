#include "codec/ValueCodec.hpp"

#include <charconv>
#include <utility>
#include <vector>

namespace RT::Codec {

auto classify(Json const& value) -> ValueShape {
    if (value.is_array()) {
        return ValueShape::Sequence;
    }
    if (value.is_object()) {
        return ValueShape::Record;
    }
    return ValueShape::Scalar;
}

auto valueShapeToString(ValueShape shape) -> std::string_view {
    switch (shape) {
    case ValueShape::Scalar:
        return "scalar";
    case ValueShape::Sequence:
        return "sequence";
    case ValueShape::Record:
        return "record";
    }
    return "unknown";
}

auto decompose(Json const& value, LeafFactory const& makeLeaf) -> NodePtr {
    switch (classify(value)) {
    case ValueShape::Scalar:
        return makeLeaf(value);
    case ValueShape::Sequence: {
        Node::Children children;
        std::size_t    index = 0;
        for (auto const& element : value) {
            children.emplace(indexSegment(index++), decompose(element, makeLeaf));
        }
        return makeBranch(std::move(children));
    }
    case ValueShape::Record: {
        Node::Children children;
        for (auto const& [key, element] : value.items()) {
            children.emplace(key, decompose(element, makeLeaf));
        }
        return makeBranch(std::move(children));
    }
    }
    return makeLeaf(value);
}

auto decomposeValue(Json const& value) -> NodePtr {
    return decompose(value, [](Json const& scalar) { return makeValue(scalar); });
}

auto toValue(NodePtr const& node) -> std::optional<Json> {
    if (!node) {
        return std::nullopt;
    }
    switch (node->kind()) {
    case Node::Kind::Value:
        return node->value().payload;
    case Node::Kind::Container:
        return node->container().value;
    case Node::Kind::Branch:
        break;
    }

    std::vector<std::pair<std::string const*, Json>> present;
    auto const& children = node->branch().children;
    present.reserve(children.size());
    for (auto const& [segment, child] : children) {
        if (auto rebuilt = toValue(child)) {
            present.emplace_back(&segment, std::move(*rebuilt));
        }
    }
    if (present.empty()) {
        return std::nullopt;
    }

    // Children are sorted lexicographically, so collect indices into slots.
    std::vector<Json*> slots(present.size(), nullptr);
    bool               sequence = true;
    for (auto& [segment, rebuilt] : present) {
        auto index = parseIndexSegment(*segment);
        if (!index || *index >= slots.size() || slots[*index] != nullptr) {
            sequence = false;
            break;
        }
        slots[*index] = &rebuilt;
    }

    if (sequence) {
        Json array = Json::array();
        for (auto* slot : slots) {
            array.push_back(std::move(*slot));
        }
        return array;
    }

    Json object = Json::object();
    for (auto& [segment, rebuilt] : present) {
        object[*segment] = std::move(rebuilt);
    }
    return object;
}

auto indexSegment(std::size_t index) -> std::string {
    return std::to_string(index);
}

auto parseIndexSegment(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty() || (segment.size() > 1 && segment.front() == '0')) {
        return std::nullopt;
    }
    std::size_t value = 0;
    auto const* end   = segment.data() + segment.size();
    auto        result = std::from_chars(segment.data(), end, value);
    if (result.ec != std::errc{} || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace RT::Codec
