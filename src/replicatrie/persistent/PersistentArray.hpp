#pragma once

#include "core/Error.hpp"
#include "trie/Node.hpp"

#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace RT {

/**
 * Immutable indexed sequence stored in a trie under segments "0".."n-1".
 *
 * Every operation returns a new array that shares untouched elements with its
 * source. Setting past the end grows the array and leaves unset slots empty;
 * empty slots read back as std::nullopt and are skipped by map, filter and
 * reduce. npos is not a valid index; set and append report OutOfRange for it.
 */
class PersistentArray {
public:
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    [[nodiscard]] static auto empty() -> PersistentArray;
    [[nodiscard]] static auto from(std::vector<Json> const& items) -> PersistentArray;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }
    [[nodiscard]] auto get(std::size_t index) const -> std::optional<Json>;

    [[nodiscard]] auto set(std::size_t index, Json const& value) const -> Expected<PersistentArray>;
    [[nodiscard]] auto append(Json const& value) const -> Expected<PersistentArray>;

    [[nodiscard]] auto map(std::function<Json(Json const&, std::size_t)> const& fn) const -> PersistentArray;
    [[nodiscard]] auto filter(std::function<bool(Json const&, std::size_t)> const& predicate) const
        -> PersistentArray;

    template <typename T, typename Fn>
    [[nodiscard]] auto reduce(Fn&& fn, T initial) const -> T {
        T result = std::move(initial);
        for (std::size_t i = 0; i < size_; ++i) {
            if (auto value = get(i)) {
                result = fn(std::move(result), *value, i);
            }
        }
        return result;
    }

    // Elements in [start, end), clamped to the array bounds.
    [[nodiscard]] auto slice(std::size_t start = 0, std::size_t end = npos) const -> PersistentArray;

    [[nodiscard]] auto toVector() const -> std::vector<std::optional<Json>>;

    [[nodiscard]] auto root() const noexcept -> NodePtr const& { return root_; }

private:
    PersistentArray(NodePtr root, std::size_t size);

    [[nodiscard]] auto withElement(std::size_t index, Json const& value) const -> NodePtr;

    NodePtr     root_;
    std::size_t size_ = 0;
};

} // namespace RT
