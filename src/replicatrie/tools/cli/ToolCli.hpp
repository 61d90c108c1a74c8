#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace RT::Tools::CLI {

// Minimal argument parser for the command line tools: flags, options taking a
// value ("--name value" or "--name=value") and positional arguments.
class ToolCli {
public:
    using ParseError = std::optional<std::string>;

    ToolCli();

    void set_program_name(std::string_view name);
    void set_error_logger(std::function<void(std::string const&)> logger);

    struct FlagOption {
        std::function<void()> on_set;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> on_value;
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_int(std::string_view name, std::function<void(int)> on_value);

    [[nodiscard]] bool parse(int argc, char const* const* argv);
    [[nodiscard]] bool had_errors() const;
    [[nodiscard]] auto positionals() const -> std::vector<std::string> const& { return positionals_; }

private:
    struct OptionEntry {
        std::string name;
        bool expects_value = false;
        std::function<void()> flag_handler;
        std::function<ParseError(std::string_view)> value_handler;
    };

    OptionEntry* find_option(std::string_view name);
    void register_option(OptionEntry entry);
    void log_error(std::string_view message);
    bool looks_like_option(std::string_view token) const;

    std::vector<OptionEntry> options_;
    std::unordered_map<std::string, std::size_t> option_lookup_;
    std::vector<std::string> positionals_;
    std::string program_name_;
    std::function<void(std::string const&)> error_logger_;
    bool had_error_ = false;
};

} // namespace RT::Tools::CLI
