#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace RT {

enum class ClockOrdering {
    Equal,
    Before,
    After,
    Concurrent
};

[[nodiscard]] auto clockOrderingToString(ClockOrdering ordering) -> std::string_view;

/**
 * Causality tracker mapping replica identifiers to monotonic counters.
 *
 * A missing replica is equivalent to a counter of zero; entries explicitly
 * holding zero compare equal to missing ones. Instances are immutable from the
 * outside: every update returns a new clock.
 */
class VectorClock {
public:
    using Entries = std::map<std::string, std::uint64_t, std::less<>>;

    VectorClock() = default;
    VectorClock(std::initializer_list<Entries::value_type> init);
    explicit VectorClock(Entries entries);

    [[nodiscard]] auto get(std::string_view replicaId) const -> std::uint64_t;
    [[nodiscard]] auto contains(std::string_view replicaId) const -> bool;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }
    // Sum of all counters; strictly grows along every causal chain.
    [[nodiscard]] auto total() const -> std::uint64_t;
    [[nodiscard]] auto entries() const noexcept -> Entries const& { return entries_; }

    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }

    [[nodiscard]] auto incremented(std::string_view replicaId) const -> VectorClock;
    [[nodiscard]] auto withEntry(std::string_view replicaId, std::uint64_t counter) const -> VectorClock;

    friend auto operator==(VectorClock const& lhs, VectorClock const& rhs) -> bool;

private:
    Entries entries_;
};

[[nodiscard]] auto compare(VectorClock const& a, VectorClock const& b) -> ClockOrdering;
[[nodiscard]] auto merge(VectorClock const& a, VectorClock const& b) -> VectorClock;
[[nodiscard]] auto increment(VectorClock const& clock, std::string_view replicaId) -> VectorClock;

[[nodiscard]] auto happensBefore(VectorClock const& a, VectorClock const& b) -> bool;
[[nodiscard]] auto concurrent(VectorClock const& a, VectorClock const& b) -> bool;
// True when a is not Before b.
[[nodiscard]] auto dominates(VectorClock const& a, VectorClock const& b) -> bool;

[[nodiscard]] auto toString(VectorClock const& clock) -> std::string;

} // namespace RT
