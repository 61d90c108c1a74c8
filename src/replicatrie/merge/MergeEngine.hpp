#pragma once

#include "merge/MergeOptions.hpp"
#include "trie/Node.hpp"
#include "trie/Trie.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace RT {

/**
 * Soft conflict observed while merging. Conflicts never fail a merge; they are
 * resolved deterministically and reported here for callers that keep an audit
 * trail.
 */
struct MergeConflict {
    enum class Kind {
        ValueValue,          // two plain values with different payloads
        ConcurrentContainer, // two containers with concurrent or equal versions and different values
        LeafKindMismatch,    // a Value leaf against a Container leaf
        StructuralConflict   // a leaf against a branch (schema evolution)
    };

    enum class Resolution {
        KeptExisting,
        TookIncoming,
        Combined
    };

    Trie::Path path;
    Kind       kind       = Kind::ValueValue;
    Resolution resolution = Resolution::KeptExisting;
};

[[nodiscard]] auto conflictKindToString(MergeConflict::Kind kind) -> std::string_view;
[[nodiscard]] auto conflictResolutionToString(MergeConflict::Resolution resolution) -> std::string_view;

struct MergeReport {
    std::vector<MergeConflict> conflicts;
    std::size_t                schemaEvolutionEvents = 0;

    [[nodiscard]] auto empty() const noexcept -> bool { return conflicts.empty(); }
};

/**
 * Reconciles two tries. existing is the local side, incoming the remote one.
 *
 * Branches merge as the union of their children. Container leaves follow their
 * vector clocks; concurrent containers combine their clocks and keep the value
 * with the greater write stamp (or whatever options.containerResolver picks).
 * Containers with equal clocks keep the greater write stamp. Equal stamps fall
 * back to the greater payload, so both merge orders pick the same leaf.
 * Plain values follow options.valuePolicy. A non-empty branch wins over a leaf,
 * and a leaf wins over an empty branch. Removals therefore do not survive a
 * merge: a tombstone left by removeValue is replaced by any leaf the other
 * side still holds at that path.
 *
 * When the merged subtree is equal to existing, existing itself is returned.
 * report may be null.
 */
[[nodiscard]] auto mergeTries(NodePtr const& existing,
                              NodePtr const& incoming,
                              MergeOptions const& options = {},
                              MergeReport* report         = nullptr) -> NodePtr;

} // namespace RT
