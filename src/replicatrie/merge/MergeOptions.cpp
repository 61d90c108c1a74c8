#include "merge/MergeOptions.hpp"

#include "log/TaggedLogger.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace RT {
namespace {

[[nodiscard]] auto normalize_flag(std::string_view raw) -> std::string {
    std::string normalized;
    normalized.reserve(raw.size());
    for (unsigned char ch : raw) {
        if (std::isspace(ch) != 0) {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(ch)));
    }
    return normalized;
}

} // namespace

auto valueMergePolicyToString(ValueMergePolicy policy) -> std::string_view {
    switch (policy) {
    case ValueMergePolicy::IncomingWins:
        return "incoming";
    case ValueMergePolicy::ExistingWins:
        return "existing";
    case ValueMergePolicy::OrderedPayload:
        return "ordered";
    }
    return "incoming";
}

auto parseValueMergePolicy(std::string_view text) -> Expected<ValueMergePolicy> {
    auto normalized = normalize_flag(text);
    if (normalized == "incoming") {
        return ValueMergePolicy::IncomingWins;
    }
    if (normalized == "existing") {
        return ValueMergePolicy::ExistingWins;
    }
    if (normalized == "ordered") {
        return ValueMergePolicy::OrderedPayload;
    }
    return std::unexpected(Error{Error::Code::MalformedInput,
                                 "unknown value merge policy '" + std::string(text) + "'"});
}

auto mergeOptionsFromEnvironment() -> MergeOptions {
    MergeOptions options;
    if (auto const* raw = std::getenv(std::string(ValueMergePolicyEnv).c_str())) {
        if (auto policy = parseValueMergePolicy(raw)) {
            options.valuePolicy = *policy;
        } else {
            rt_log(describeError(policy.error()), "MergeOptions", "WARNING");
        }
    }
    return options;
}

} // namespace RT
