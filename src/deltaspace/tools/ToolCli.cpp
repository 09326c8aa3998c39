#include "tools/ToolCli.hpp"

#include <charconv>
#include <utility>

namespace DS::Tools {

ToolCli::ToolCli(std::string_view programName)
    : program_name_(programName) {}

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

void ToolCli::add_count(std::string_view name, CountOption option) {
    ValueOption value_opt{};
    value_opt.on_value = [stored = std::string(name), handler = std::move(option.on_value)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires a count";
        }
        std::size_t value  = 0;
        auto        end    = token.data() + token.size();
        auto        result = std::from_chars(token.data(), end, value);
        if (result.ec != std::errc{} || result.ptr != end) {
            return stored + " expects a non-negative integer, got '" + std::string(token) + "'";
        }
        handler(value);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void ToolCli::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        record_error("alias '" + std::string(alias) + "' names unknown option '" + std::string(target) + "'");
        return;
    }
    option_lookup_.emplace(std::string(alias), target_it->second);
}

void ToolCli::set_positional_handler(std::function<ParseError(std::string_view)> handler) {
    positional_handler_ = std::move(handler);
}

bool ToolCli::parse(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string_view                raw_token{argv[i]};
        std::string_view                name = raw_token;
        std::optional<std::string_view> attached_value;
        if (raw_token.starts_with("--")) {
            if (auto equals_pos = raw_token.find('='); equals_pos != std::string_view::npos) {
                name           = raw_token.substr(0, equals_pos);
                attached_value = raw_token.substr(equals_pos + 1);
            }
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            if (raw_token.size() > 1 && raw_token.front() == '-') {
                record_error("unknown option '" + std::string(raw_token) + "'");
            } else if (!positional_handler_) {
                record_error("unexpected argument '" + std::string(raw_token) + "'");
            } else if (auto error = positional_handler_(raw_token)) {
                record_error(*error);
            }
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                record_error(entry->name + " does not take a value");
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
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            record_error(entry->name + " requires a value");
            continue;
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(value)) {
                record_error(*error);
            }
        }
    }
    return errors_.empty();
}

auto ToolCli::find_option(std::string_view name) -> OptionEntry* {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void ToolCli::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    option_lookup_.emplace(options_.back().name, options_.size() - 1);
}

void ToolCli::record_error(std::string_view message) {
    errors_.push_back(program_name_ + ": " + std::string(message));
}

} // namespace DS::Tools
