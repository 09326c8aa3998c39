#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace DS::Tools {

/**
 * Small argument parser shared by the command line tools.
 *
 * Options are `--name`, `--name value` or `--name=value`. Tokens that do not
 * name an option go to the positional handler. Problems are collected and
 * parsing continues, so one run reports every bad argument.
 */
class ToolCli {
public:
    using ParseError = std::optional<std::string>;

    explicit ToolCli(std::string_view programName);

    struct FlagOption {
        std::function<void()> on_set;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> on_value;
    };

    struct CountOption {
        std::function<void(std::size_t)> on_value;
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_count(std::string_view name, CountOption option);
    void add_alias(std::string_view alias, std::string_view target);
    void set_positional_handler(std::function<ParseError(std::string_view)> handler);

    [[nodiscard]] bool parse(int argc, char** argv);
    [[nodiscard]] auto errors() const -> std::vector<std::string> const& { return errors_; }
    [[nodiscard]] auto program_name() const -> std::string const& { return program_name_; }

private:
    struct OptionEntry {
        std::string                                  name;
        bool                                         expects_value = false;
        std::function<void()>                        flag_handler;
        std::function<ParseError(std::string_view)>  value_handler;
    };

    auto find_option(std::string_view name) -> OptionEntry*;
    void register_option(OptionEntry entry);
    void record_error(std::string_view message);

    std::vector<OptionEntry>                     options_;
    std::unordered_map<std::string, std::size_t> option_lookup_;
    std::string                                  program_name_;
    std::function<ParseError(std::string_view)>  positional_handler_;
    std::vector<std::string>                     errors_;
};

} // namespace DS::Tools
