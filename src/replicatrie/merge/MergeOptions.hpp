#pragma once

#include "core/Error.hpp"
#include "trie/Node.hpp"

#include <functional>
#include <string_view>

namespace RT {

/*
 * Resolution for two plain Value leaves holding different payloads. Values carry
 * no causal metadata, so this is a policy choice:
 * - IncomingWins: the second (incoming) argument of the merge wins
 * - ExistingWins: the first argument wins
 * - OrderedPayload: the greater payload under json ordering wins; the only
 *   policy that makes Value/Value merges commutative
 */
enum class ValueMergePolicy {
    IncomingWins,
    ExistingWins,
    OrderedPayload
};

[[nodiscard]] auto valueMergePolicyToString(ValueMergePolicy policy) -> std::string_view;
[[nodiscard]] auto parseValueMergePolicy(std::string_view text) -> Expected<ValueMergePolicy>;

// Picks the value kept by two concurrent Container leaves. Must be deterministic
// and symmetric for replicas to converge.
using ContainerResolver = std::function<Json(Node::Container const& existing, Node::Container const& incoming)>;

struct MergeOptions {
    ValueMergePolicy  valuePolicy = ValueMergePolicy::IncomingWins;
    ContainerResolver containerResolver;
    bool              recordConflicts = true;
};

inline constexpr std::string_view ValueMergePolicyEnv = "REPLICATRIE_VALUE_MERGE_POLICY";

// MergeOptions with valuePolicy taken from REPLICATRIE_VALUE_MERGE_POLICY when set and valid.
[[nodiscard]] auto mergeOptionsFromEnvironment() -> MergeOptions;

} // namespace RT
