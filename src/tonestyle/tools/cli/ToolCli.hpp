#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS::Tools::CLI {

/**
 * Argument parser for the tonestyle command line tools.
 *
 * Options are `--name`, `--name value` or `--name=value`; short aliases map
 * onto a long name. Handlers run in argument order. A handler that returns a
 * message fails the parse, and the message goes to the error logger (stderr
 * unless replaced) prefixed with the program name. Parsing continues after an
 * error so every problem on the command line is reported at once.
 */
class ToolCli {
public:
    using ParseError = std::optional<std::string>;

    explicit ToolCli(std::string program_name = "tonestyle");

    void set_error_logger(std::function<void(std::string const&)> logger);
    // Receives tokens that do not start with '-'. Without a handler they are errors.
    void set_positional_handler(std::function<ParseError(std::string_view)> handler);

    void add_flag(std::string_view name, std::string_view help, std::function<void()> on_set);
    void add_value(std::string_view name,
                   std::string_view metavar,
                   std::string_view help,
                   std::function<ParseError(std::string_view)> on_value);
    void add_int(std::string_view name,
                 std::string_view metavar,
                 std::string_view help,
                 std::function<ParseError(int)> on_value);
    void add_alias(std::string_view alias, std::string_view target);

    [[nodiscard]] bool parse(int argc, char** argv);
    [[nodiscard]] bool had_errors() const;
    [[nodiscard]] auto program_name() const -> std::string const&;
    // One line per option: names, metavar and help text.
    [[nodiscard]] auto usage() const -> std::string;

private:
    struct Option {
        std::string              name;
        std::vector<std::string> aliases;
        std::string              metavar;
        std::string              help;
        bool                     takes_value = false;
        std::function<ParseError(std::string_view)> handler;
    };

    auto lookup(std::string_view name) const -> Option const*;
    auto add_option(Option option) -> void;
    auto report(std::string_view message) -> void;

    std::string                                          program_;
    std::vector<Option>                                  options_;
    std::map<std::string, std::size_t, std::less<>>      names_;
    std::function<ParseError(std::string_view)>          positional_;
    std::function<void(std::string const&)>              error_logger_;
    bool                                                 failed_ = false;
    // Set by a bad registration; survives every parse().
    bool                                                 misconfigured_ = false;
};

} // namespace TS::Tools::CLI
