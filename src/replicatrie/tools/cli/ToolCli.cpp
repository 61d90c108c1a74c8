#include "ToolCli.hpp"

#include <charconv>
#include <iostream>
#include <string>

namespace RT::Tools::CLI {

ToolCli::ToolCli() = default;

void ToolCli::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void ToolCli::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void ToolCli::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void ToolCli::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void ToolCli::add_int(std::string_view name, std::function<void(int)> on_value) {
    ValueOption value_opt{};
    value_opt.on_value = [stored = std::string(name), handler = std::move(on_value)](std::string_view token) -> ParseError {
        int value = 0;
        auto begin = token.data();
        auto end = begin + token.size();
        auto result = std::from_chars(begin, end, value);
        if (token.empty() || result.ec != std::errc{} || result.ptr != end) {
            return stored + " expects a numeric value";
        }
        handler(value);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

bool ToolCli::parse(int argc, char const* const* argv) {
    had_error_ = false;
    positionals_.clear();
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view raw_token{argv[i]};
        if (options_done || !looks_like_option(raw_token)) {
            positionals_.emplace_back(raw_token);
            continue;
        }
        if (raw_token == "--") {
            options_done = true;
            continue;
        }

        std::optional<std::string_view> attached_value;
        std::string_view name = raw_token;
        auto equals_pos = raw_token.find('=');
        if (equals_pos != std::string_view::npos) {
            name = raw_token.substr(0, equals_pos);
            attached_value = raw_token.substr(equals_pos + 1);
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            std::string message = "unknown argument '";
            message.append(raw_token.begin(), raw_token.end());
            message.push_back('\'');
            log_error(message);
            had_error_ = true;
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                log_error(entry->name + " does not accept a value");
                had_error_ = true;
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        std::string_view value;
        if (attached_value) {
            value = *attached_value;
        } else if ((i + 1) < argc) {
            value = std::string_view{argv[++i]};
        } else {
            log_error(entry->name + " requires a value");
            had_error_ = true;
            continue;
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(value)) {
                log_error(*error);
                had_error_ = true;
            }
        }
    }
    return !had_error_;
}

bool ToolCli::had_errors() const {
    return had_error_;
}

ToolCli::OptionEntry* ToolCli::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void ToolCli::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    auto index = options_.size() - 1;
    option_lookup_.insert_or_assign(options_.back().name, index);
}

void ToolCli::log_error(std::string_view message) {
    std::string text = program_name_.empty() ? std::string("replicatrie") : program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

bool ToolCli::looks_like_option(std::string_view token) const {
    return token.size() > 1 && token.front() == '-';
}

} // namespace RT::Tools::CLI
