#pragma once

#include "clock/VectorClock.hpp"
#include "core/Error.hpp"
#include "merge/MergeEngine.hpp"
#include "trie/Trie.hpp"

#include <string>
#include <string_view>

namespace RT {

/**
 * One replica's view of the shared state: the unit replicas exchange and merge.
 *
 * Containers are values. Every write returns a successor with version[id]
 * advanced by exactly one and the root rebuilt along the written path; the
 * receiver is left untouched, so earlier containers remain usable as history.
 */
struct Container {
    std::string id;
    NodePtr     root;
    VectorClock version;

    [[nodiscard]] auto get(Trie::Path const& path) const -> NodePtr { return Trie::get(root, path); }
    [[nodiscard]] auto has(Trie::Path const& path) const -> bool { return Trie::has(root, path); }
    [[nodiscard]] auto valueAt(Trie::Path const& path) const -> std::optional<Json> {
        return Trie::valueAt(root, path);
    }
    [[nodiscard]] auto toValue() const -> std::optional<Json>;

    [[nodiscard]] auto setValue(Trie::Path const& path, Json const& payload) const -> Expected<Container>;
    [[nodiscard]] auto setContainer(Trie::Path const& path, Json const& payload) const -> Expected<Container>;
    [[nodiscard]] auto updateValue(Trie::Path const& path, Json const& payload) const -> Expected<Container>;
    [[nodiscard]] auto removeValue(Trie::Path const& path) const -> Container;
    [[nodiscard]] auto removePath(Trie::Path const& path) const -> Container;

    // Same version and structurally equal roots; ids are not compared.
    [[nodiscard]] auto sameState(Container const& other) const -> bool;

    friend auto operator==(Container const& lhs, Container const& rhs) -> bool;
};

// A container with an empty root and version {id: 0}.
[[nodiscard]] auto createContainer(std::string_view id) -> Container;

/**
 * Merges two containers.
 *
 * Containers sharing an id are versions of one replica: the one whose version
 * is not Before the other is returned unchanged. Otherwise the result keeps
 * existing.id, joins both versions and merges the roots with mergeTries.
 * A replica that forked (same id, concurrent versions, or equal versions with
 * different roots) is merged structurally.
 */
[[nodiscard]] auto mergeContainers(Container const& existing,
                                   Container const& incoming,
                                   MergeOptions const& options = {},
                                   MergeReport* report         = nullptr) -> Container;

} // namespace RT
