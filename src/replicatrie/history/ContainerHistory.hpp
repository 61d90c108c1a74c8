#pragma once

#include "container/Container.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace RT::History {

struct TrieStats {
    std::size_t uniqueNodes    = 0;
    std::size_t leafCount      = 0;
    std::size_t tombstoneCount = 0;
};

struct TrieDelta {
    std::size_t newNodes     = 0;
    std::size_t reusedNodes  = 0;
    std::size_t removedNodes = 0;
};

/**
 * Append-only log of container snapshots.
 *
 * Snapshots share every unchanged subtree with their neighbours, so keeping a
 * long history costs roughly one path of nodes per write. The statistics
 * helpers count nodes by identity to make that sharing observable.
 */
class ContainerHistory {
public:
    struct Snapshot {
        Container   container;
        std::size_t generation = 0;
    };

    ContainerHistory() = default;

    // Returns the generation assigned to the snapshot.
    auto record(Container container) -> std::size_t;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return snapshots_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return snapshots_.empty(); }
    [[nodiscard]] auto latest() const -> std::optional<Snapshot>;
    [[nodiscard]] auto at(std::size_t generation) const -> std::optional<Snapshot>;
    [[nodiscard]] auto snapshots() const noexcept -> std::vector<Snapshot> const& { return snapshots_; }

    // Unique nodes across every recorded snapshot.
    [[nodiscard]] auto analyze() const -> TrieStats;

    [[nodiscard]] static auto analyze(NodePtr const& root) -> TrieStats;
    [[nodiscard]] static auto analyzeDelta(NodePtr const& baseline, NodePtr const& updated) -> TrieDelta;

private:
    std::vector<Snapshot> snapshots_;
    std::size_t           nextGeneration_ = 1;
};

} // namespace RT::History
