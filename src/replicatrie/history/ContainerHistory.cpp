#include "history/ContainerHistory.hpp"

#include "log/TaggedLogger.hpp"

#include <parallel_hashmap/phmap.h>

#include <algorithm>
#include <utility>

namespace RT::History {
namespace {

using NodeSet = phmap::flat_hash_set<Node const*>;

// Walks every node reachable from roots once, in no particular order.
template <typename Visitor>
void visitUnique(std::vector<NodePtr> stack, NodeSet& visited, Visitor&& visit) {
    while (!stack.empty()) {
        NodePtr current = std::move(stack.back());
        stack.pop_back();
        auto raw = current.get();
        if (!raw || !visited.insert(raw).second) {
            continue;
        }
        visit(*current);
        if (current->isBranch()) {
            for (auto const& [_, child] : current->branch().children) {
                if (child) {
                    stack.push_back(child);
                }
            }
        }
    }
}

void accumulate(Node const& node, TrieStats& stats) {
    stats.uniqueNodes++;
    if (node.isLeaf()) {
        stats.leafCount++;
    } else if (node.isTombstone()) {
        stats.tombstoneCount++;
    }
}

} // namespace

auto ContainerHistory::record(Container container) -> std::size_t {
    auto generation = nextGeneration_++;
    rt_log("Recorded " + container.id + " " + toString(container.version) + " as generation "
               + std::to_string(generation),
           "History");
    snapshots_.push_back(Snapshot{std::move(container), generation});
    return generation;
}

auto ContainerHistory::latest() const -> std::optional<Snapshot> {
    if (snapshots_.empty()) {
        return std::nullopt;
    }
    return snapshots_.back();
}

auto ContainerHistory::at(std::size_t generation) const -> std::optional<Snapshot> {
    auto it = std::lower_bound(snapshots_.begin(), snapshots_.end(), generation,
                               [](Snapshot const& snap, std::size_t value) { return snap.generation < value; });
    if (it == snapshots_.end() || it->generation != generation) {
        return std::nullopt;
    }
    return *it;
}

auto ContainerHistory::analyze() const -> TrieStats {
    TrieStats            stats;
    NodeSet              visited;
    std::vector<NodePtr> roots;
    roots.reserve(snapshots_.size());
    for (auto const& snap : snapshots_) {
        roots.push_back(snap.container.root);
    }
    visitUnique(std::move(roots), visited, [&](Node const& node) { accumulate(node, stats); });
    return stats;
}

auto ContainerHistory::analyze(NodePtr const& root) -> TrieStats {
    TrieStats stats;
    NodeSet   visited;
    visitUnique({root}, visited, [&](Node const& node) { accumulate(node, stats); });
    return stats;
}

auto ContainerHistory::analyzeDelta(NodePtr const& baseline, NodePtr const& updated) -> TrieDelta {
    TrieDelta delta;

    NodeSet baselineSet;
    visitUnique({baseline}, baselineSet, [](Node const&) {});

    NodeSet updatedSet;
    visitUnique({updated}, updatedSet, [&](Node const& node) {
        if (baselineSet.contains(&node)) {
            delta.reusedNodes++;
        } else {
            delta.newNodes++;
        }
    });

    for (auto const* node : baselineSet) {
        if (!updatedSet.contains(node)) {
            delta.removedNodes++;
        }
    }
    return delta;
}

} // namespace RT::History
