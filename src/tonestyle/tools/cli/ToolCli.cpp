#include "ToolCli.hpp"

#include <algorithm>
#include <charconv>
#include <iostream>
#include <utility>

namespace TS::Tools::CLI {

namespace {

constexpr std::size_t kHelpColumn = 30;

auto quoted(std::string_view text) -> std::string {
    std::string out{"'"};
    out.append(text);
    out.push_back('\'');
    return out;
}

} // namespace

ToolCli::ToolCli(std::string program_name)
    : program_(std::move(program_name)) {}

void ToolCli::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void ToolCli::set_positional_handler(std::function<ParseError(std::string_view)> handler) {
    positional_ = std::move(handler);
}

void ToolCli::add_flag(std::string_view name, std::string_view help, std::function<void()> on_set) {
    Option option;
    option.name    = std::string(name);
    option.help    = std::string(help);
    option.handler = [on_set = std::move(on_set)](std::string_view) -> ParseError {
        if (on_set) {
            on_set();
        }
        return std::nullopt;
    };
    add_option(std::move(option));
}

void ToolCli::add_value(std::string_view name,
                        std::string_view metavar,
                        std::string_view help,
                        std::function<ParseError(std::string_view)> on_value) {
    Option option;
    option.name        = std::string(name);
    option.metavar     = std::string(metavar);
    option.help        = std::string(help);
    option.takes_value = true;
    option.handler     = std::move(on_value);
    add_option(std::move(option));
}

void ToolCli::add_int(std::string_view name,
                      std::string_view metavar,
                      std::string_view help,
                      std::function<ParseError(int)> on_value) {
    auto convert = [label = std::string(name), on_value = std::move(on_value)](std::string_view token) -> ParseError {
        int value = 0;
        auto const* end = token.data() + token.size();
        auto [ptr, ec]  = std::from_chars(token.data(), end, value);
        if (token.empty() || ec != std::errc{} || ptr != end) {
            return label + " expects an integer, got " + quoted(token);
        }
        return on_value(value);
    };
    add_value(name, metavar, help, std::move(convert));
}

void ToolCli::add_alias(std::string_view alias, std::string_view target) {
    auto it = names_.find(target);
    if (it == names_.end()) {
        misconfigured_ = true;
        report("alias " + std::string(alias) + " targets unknown option " + std::string(target));
        return;
    }
    options_[it->second].aliases.emplace_back(alias);
    names_.insert_or_assign(std::string(alias), it->second);
}

bool ToolCli::parse(int argc, char** argv) {
    failed_ = misconfigured_;
    for (int index = 1; index < argc; ++index) {
        std::string_view token{argv[index]};
        if (token.size() < 2 || token.front() != '-') {
            if (!positional_) {
                report("unexpected argument " + quoted(token));
            } else if (auto error = positional_(token)) {
                report(*error);
            }
            continue;
        }

        std::string_view                name = token;
        std::optional<std::string_view> attached;
        if (auto equals = token.find('='); equals != std::string_view::npos) {
            name     = token.substr(0, equals);
            attached = token.substr(equals + 1);
        }

        auto const* option = lookup(name);
        if (option == nullptr) {
            report("unknown option " + quoted(name));
            continue;
        }
        std::string_view value;
        if (!option->takes_value) {
            if (attached) {
                report(option->name + " does not take a value");
                continue;
            }
        } else if (attached) {
            value = *attached;
        } else if (index + 1 < argc) {
            value = argv[++index];
        } else {
            report(option->name + " requires a value");
            continue;
        }
        if (auto error = option->handler(value)) {
            report(*error);
        }
    }
    return !failed_;
}

bool ToolCli::had_errors() const {
    return failed_ || misconfigured_;
}

auto ToolCli::program_name() const -> std::string const& {
    return program_;
}

auto ToolCli::usage() const -> std::string {
    std::string text = "usage: " + program_ + " [options]\n";
    for (auto const& option : options_) {
        std::string line = "  " + option.name;
        for (auto const& alias : option.aliases) {
            line += ", " + alias;
        }
        if (option.takes_value) {
            line += " <" + option.metavar + ">";
        }
        if (!option.help.empty()) {
            line.append(std::max<std::size_t>(2, kHelpColumn - std::min(kHelpColumn, line.size())), ' ');
            line += option.help;
        }
        text += line;
        text.push_back('\n');
    }
    return text;
}

auto ToolCli::lookup(std::string_view name) const -> Option const* {
    auto it = names_.find(name);
    return it == names_.end() ? nullptr : &options_[it->second];
}

auto ToolCli::add_option(Option option) -> void {
    auto name = option.name;
    options_.push_back(std::move(option));
    names_.insert_or_assign(std::move(name), options_.size() - 1);
}

auto ToolCli::report(std::string_view message) -> void {
    failed_ = true;
    std::string text = program_ + ": ";
    text.append(message);
    if (error_logger_) {
        error_logger_(text);
        return;
    }
    std::cerr << text << '\n';
}

} // namespace TS::Tools::CLI
