#include "clock/VectorClock.hpp"

#include <algorithm>
#include <sstream>

namespace RT {

auto clockOrderingToString(ClockOrdering ordering) -> std::string_view {
    switch (ordering) {
    case ClockOrdering::Equal:
        return "equal";
    case ClockOrdering::Before:
        return "before";
    case ClockOrdering::After:
        return "after";
    case ClockOrdering::Concurrent:
        return "concurrent";
    }
    return "unknown";
}

VectorClock::VectorClock(std::initializer_list<Entries::value_type> init)
    : entries_(init) {}

VectorClock::VectorClock(Entries entries)
    : entries_(std::move(entries)) {}

auto VectorClock::get(std::string_view replicaId) const -> std::uint64_t {
    auto it = entries_.find(replicaId);
    return it != entries_.end() ? it->second : 0;
}

auto VectorClock::contains(std::string_view replicaId) const -> bool {
    return entries_.find(replicaId) != entries_.end();
}

auto VectorClock::total() const -> std::uint64_t {
    std::uint64_t sum = 0;
    for (auto const& [_, counter] : entries_) {
        sum += counter;
    }
    return sum;
}

auto VectorClock::incremented(std::string_view replicaId) const -> VectorClock {
    return withEntry(replicaId, get(replicaId) + 1);
}

auto VectorClock::withEntry(std::string_view replicaId, std::uint64_t counter) const -> VectorClock {
    VectorClock next{*this};
    auto it = next.entries_.find(replicaId);
    if (it != next.entries_.end()) {
        it->second = counter;
    } else {
        next.entries_.emplace(std::string{replicaId}, counter);
    }
    return next;
}

auto operator==(VectorClock const& lhs, VectorClock const& rhs) -> bool {
    return compare(lhs, rhs) == ClockOrdering::Equal;
}

auto compare(VectorClock const& a, VectorClock const& b) -> ClockOrdering {
    bool aLess    = false;
    bool aGreater = false;

    // Both maps are sorted, so walk the union of keys in one pass.
    auto itA = a.entries().begin();
    auto itB = b.entries().begin();
    auto endA = a.entries().end();
    auto endB = b.entries().end();
    while (itA != endA || itB != endB) {
        std::uint64_t va = 0;
        std::uint64_t vb = 0;
        if (itB == endB || (itA != endA && itA->first < itB->first)) {
            va = itA->second;
            ++itA;
        } else if (itA == endA || itB->first < itA->first) {
            vb = itB->second;
            ++itB;
        } else {
            va = itA->second;
            vb = itB->second;
            ++itA;
            ++itB;
        }
        if (va < vb) aLess = true;
        if (va > vb) aGreater = true;
        if (aLess && aGreater) {
            return ClockOrdering::Concurrent;
        }
    }

    if (aLess) return ClockOrdering::Before;
    if (aGreater) return ClockOrdering::After;
    return ClockOrdering::Equal;
}

auto merge(VectorClock const& a, VectorClock const& b) -> VectorClock {
    VectorClock::Entries result = a.entries();
    for (auto const& [replica, counter] : b.entries()) {
        auto [it, inserted] = result.try_emplace(replica, counter);
        if (!inserted) {
            it->second = std::max(it->second, counter);
        }
    }
    return VectorClock{std::move(result)};
}

auto increment(VectorClock const& clock, std::string_view replicaId) -> VectorClock {
    return clock.incremented(replicaId);
}

auto happensBefore(VectorClock const& a, VectorClock const& b) -> bool {
    return compare(a, b) == ClockOrdering::Before;
}

auto concurrent(VectorClock const& a, VectorClock const& b) -> bool {
    return compare(a, b) == ClockOrdering::Concurrent;
}

auto dominates(VectorClock const& a, VectorClock const& b) -> bool {
    return compare(a, b) != ClockOrdering::Before;
}

auto toString(VectorClock const& clock) -> std::string {
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (auto const& [replica, counter] : clock) {
        if (!first) oss << ',';
        oss << replica << ':' << counter;
        first = false;
    }
    oss << '}';
    return oss.str();
}

} // namespace RT
