#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace RT {

struct Error {
    enum class Code {
        NoSuchPath = 0,
        InvalidPath,
        PathThroughLeaf,
        TypeMismatch,
        MalformedInput,
        OutOfRange
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::NoSuchPath:
        return "no_such_path";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::PathThroughLeaf:
        return "path_through_leaf";
    case Error::Code::TypeMismatch:
        return "type_mismatch";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::OutOfRange:
        return "out_of_range";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace RT
