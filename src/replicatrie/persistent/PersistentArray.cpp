#include "persistent/PersistentArray.hpp"

#include "codec/ValueCodec.hpp"
#include "trie/Trie.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace RT {

PersistentArray::PersistentArray(NodePtr root, std::size_t size)
    : root_(std::move(root)), size_(size) {}

auto PersistentArray::empty() -> PersistentArray {
    return PersistentArray{Trie::empty(), 0};
}

auto PersistentArray::from(std::vector<Json> const& items) -> PersistentArray {
    Node::Children children;
    for (std::size_t i = 0; i < items.size(); ++i) {
        children.emplace(Codec::indexSegment(i), Codec::decomposeValue(items[i]));
    }
    return PersistentArray{makeBranch(std::move(children)), items.size()};
}

auto PersistentArray::get(std::size_t index) const -> std::optional<Json> {
    if (index >= size_) {
        return std::nullopt;
    }
    return Codec::toValue(root_->child(Codec::indexSegment(index)));
}

auto PersistentArray::withElement(std::size_t index, Json const& value) const -> NodePtr {
    Node::Children children = root_->branch().children;
    children.insert_or_assign(Codec::indexSegment(index), Codec::decomposeValue(value));
    return makeBranch(std::move(children));
}

auto PersistentArray::set(std::size_t index, Json const& value) const -> Expected<PersistentArray> {
    if (index >= npos) {
        return std::unexpected(Error{Error::Code::OutOfRange, "index " + std::to_string(index) + " is out of bounds"});
    }
    return PersistentArray{withElement(index, value), std::max(size_, index + 1)};
}

auto PersistentArray::append(Json const& value) const -> Expected<PersistentArray> {
    return set(size_, value);
}

auto PersistentArray::map(std::function<Json(Json const&, std::size_t)> const& fn) const -> PersistentArray {
    Node::Children children;
    for (std::size_t i = 0; i < size_; ++i) {
        if (auto value = get(i)) {
            children.emplace(Codec::indexSegment(i), Codec::decomposeValue(fn(*value, i)));
        }
    }
    return PersistentArray{makeBranch(std::move(children)), size_};
}

auto PersistentArray::filter(std::function<bool(Json const&, std::size_t)> const& predicate) const
    -> PersistentArray {
    Node::Children children;
    std::size_t    next = 0;
    for (std::size_t i = 0; i < size_; ++i) {
        auto value = get(i);
        if (value && predicate(*value, i)) {
            // Kept elements are reused as-is.
            children.emplace(Codec::indexSegment(next++), root_->child(Codec::indexSegment(i)));
        }
    }
    return PersistentArray{makeBranch(std::move(children)), next};
}

auto PersistentArray::slice(std::size_t start, std::size_t end) const -> PersistentArray {
    end   = std::min(end, size_);
    start = std::min(start, end);
    Node::Children children;
    for (std::size_t i = start; i < end; ++i) {
        if (auto child = root_->child(Codec::indexSegment(i))) {
            children.emplace(Codec::indexSegment(i - start), std::move(child));
        }
    }
    return PersistentArray{makeBranch(std::move(children)), end - start};
}

auto PersistentArray::toVector() const -> std::vector<std::optional<Json>> {
    std::vector<std::optional<Json>> result;
    result.reserve(size_);
    for (std::size_t i = 0; i < size_; ++i) {
        result.push_back(get(i));
    }
    return result;
}

} // namespace RT
