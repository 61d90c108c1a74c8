#include "merge/MergeEngine.hpp"

#include "log/TaggedLogger.hpp"

#include <utility>

namespace RT {
namespace {

struct MergeContext {
    MergeOptions const& options;
    MergeReport*        report;
    Trie::Path          path;

    void record(MergeConflict::Kind kind, MergeConflict::Resolution resolution) {
        rt_log("Merge conflict (" + std::string(conflictKindToString(kind)) + ") at " + Trie::pathToString(path)
                   + " resolved as " + std::string(conflictResolutionToString(resolution)),
               "MergeEngine");
        if (kind == MergeConflict::Kind::StructuralConflict) {
            rt_log("Leaf/branch mismatch at " + Trie::pathToString(path), "MergeEngine", "SchemaEvolution");
        }
        if (!report) {
            return;
        }
        if (kind == MergeConflict::Kind::StructuralConflict) {
            ++report->schemaEvolutionEvents;
        }
        if (options.recordConflicts) {
            report->conflicts.push_back(MergeConflict{path, kind, resolution});
        }
    }
};

auto mergeNodes(NodePtr const& a, NodePtr const& b, MergeContext& ctx) -> NodePtr;

auto mergeValues(NodePtr const& a, NodePtr const& b, MergeContext& ctx) -> NodePtr {
    auto const& pa = a->value().payload;
    auto const& pb = b->value().payload;
    if (pa == pb) {
        return a;
    }
    bool takeIncoming = false;
    switch (ctx.options.valuePolicy) {
    case ValueMergePolicy::IncomingWins:
        takeIncoming = true;
        break;
    case ValueMergePolicy::ExistingWins:
        takeIncoming = false;
        break;
    case ValueMergePolicy::OrderedPayload:
        takeIncoming = pa < pb;
        break;
    }
    ctx.record(MergeConflict::Kind::ValueValue,
               takeIncoming ? MergeConflict::Resolution::TookIncoming : MergeConflict::Resolution::KeptExisting);
    return takeIncoming ? b : a;
}

// Orders writes by stamp, then by payload. Both sides agree on the outcome
// regardless of argument order.
auto writeWins(Node::Container const& candidate, Node::Container const& other) -> bool {
    if (candidate.stamp != other.stamp) {
        return candidate.stamp > other.stamp;
    }
    return other.value < candidate.value;
}

auto mergeContainerLeaves(NodePtr const& a, NodePtr const& b, MergeContext& ctx) -> NodePtr {
    auto const& ca = a->container();
    auto const& cb = b->container();
    switch (compare(ca.version, cb.version)) {
    case ClockOrdering::Before:
        return b;
    case ClockOrdering::After:
        return a;
    case ClockOrdering::Equal:
        if (ca.value != cb.value) {
            ctx.record(MergeConflict::Kind::ConcurrentContainer,
                       writeWins(cb, ca) ? MergeConflict::Resolution::TookIncoming
                                         : MergeConflict::Resolution::KeptExisting);
        }
        return writeWins(cb, ca) ? b : a;
    case ClockOrdering::Concurrent:
        break;
    }

    auto const& winner = writeWins(cb, ca) ? cb : ca;
    Json        value  = ctx.options.containerResolver ? ctx.options.containerResolver(ca, cb) : winner.value;
    if (ca.value != cb.value) {
        ctx.record(MergeConflict::Kind::ConcurrentContainer, MergeConflict::Resolution::Combined);
    }
    return makeContainer(std::move(value), merge(ca.version, cb.version), winner.stamp);
}

auto mergeBranches(NodePtr const& a, NodePtr const& b, MergeContext& ctx) -> NodePtr {
    Node::Children children = a->branch().children;
    bool           changed  = false;
    for (auto const& [segment, incomingChild] : b->branch().children) {
        auto it = children.find(segment);
        if (it == children.end()) {
            children.emplace(segment, incomingChild);
            changed = true;
            continue;
        }
        ctx.path.push_back(segment);
        auto merged = mergeNodes(it->second, incomingChild, ctx);
        ctx.path.pop_back();
        if (merged.get() != it->second.get()) {
            it->second = std::move(merged);
            changed    = true;
        }
    }
    if (!changed) {
        return a;
    }
    return makeBranch(std::move(children));
}

auto mergeNodes(NodePtr const& a, NodePtr const& b, MergeContext& ctx) -> NodePtr {
    if (!a) return b;
    if (!b) return a;
    if (a.get() == b.get()) return a;

    auto const ka = a->kind();
    auto const kb = b->kind();

    if (ka == Node::Kind::Branch && kb == Node::Kind::Branch) {
        return mergeBranches(a, b, ctx);
    }
    if (ka == Node::Kind::Value && kb == Node::Kind::Value) {
        return mergeValues(a, b, ctx);
    }
    if (ka == Node::Kind::Container && kb == Node::Kind::Container) {
        return mergeContainerLeaves(a, b, ctx);
    }

    if (a->isLeaf() && b->isLeaf()) {
        // Value against Container: the versioned side wins.
        bool const takeIncoming = kb == Node::Kind::Container;
        ctx.record(MergeConflict::Kind::LeafKindMismatch,
                   takeIncoming ? MergeConflict::Resolution::TookIncoming
                                : MergeConflict::Resolution::KeptExisting);
        return takeIncoming ? b : a;
    }

    // Leaf against branch. A branch holding children keeps data reachable under
    // unique paths; an empty branch is only a tombstone and yields to the leaf.
    auto const& branchSide   = a->isBranch() ? a : b;
    bool const  branchWins   = !branchSide->isTombstone();
    bool const  takeIncoming = branchWins ? b->isBranch() : b->isLeaf();
    ctx.record(MergeConflict::Kind::StructuralConflict,
               takeIncoming ? MergeConflict::Resolution::TookIncoming : MergeConflict::Resolution::KeptExisting);
    return takeIncoming ? b : a;
}

} // namespace

auto conflictKindToString(MergeConflict::Kind kind) -> std::string_view {
    switch (kind) {
    case MergeConflict::Kind::ValueValue:
        return "value_value";
    case MergeConflict::Kind::ConcurrentContainer:
        return "concurrent_container";
    case MergeConflict::Kind::LeafKindMismatch:
        return "leaf_kind_mismatch";
    case MergeConflict::Kind::StructuralConflict:
        return "structural_conflict";
    }
    return "unknown";
}

auto conflictResolutionToString(MergeConflict::Resolution resolution) -> std::string_view {
    switch (resolution) {
    case MergeConflict::Resolution::KeptExisting:
        return "kept_existing";
    case MergeConflict::Resolution::TookIncoming:
        return "took_incoming";
    case MergeConflict::Resolution::Combined:
        return "combined";
    }
    return "unknown";
}

auto mergeTries(NodePtr const& existing, NodePtr const& incoming, MergeOptions const& options, MergeReport* report)
    -> NodePtr {
    MergeContext ctx{options, report, {}};
    return mergeNodes(existing, incoming, ctx);
}

} // namespace RT
