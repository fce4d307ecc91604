#include <doctest/doctest.h>

#include <tonestyle/tools/cli/ToolCli.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

using TS::Tools::CLI::ToolCli;

namespace {

struct Harness {
    explicit Harness(std::string program = "tonestyle_test")
        : cli(std::move(program)) {
        cli.set_error_logger([this](std::string const& message) { errors.push_back(message); });
    }

    auto run(std::initializer_list<const char*> args) -> bool {
        std::vector<char*> argv{const_cast<char*>("prog")};
        for (auto* value : args) {
            argv.push_back(const_cast<char*>(value));
        }
        return cli.parse(static_cast<int>(argv.size()), argv.data());
    }

    ToolCli                  cli;
    std::vector<std::string> errors;
};

auto store(std::string& target) {
    return [&target](std::string_view value) -> ToolCli::ParseError {
        target = std::string(value);
        return std::nullopt;
    };
}

} // namespace

TEST_SUITE("tools.cli") {

TEST_CASE("flags and values in both spellings") {
    Harness h;
    bool colors = false;
    std::string mode;
    std::string palette;
    h.cli.add_flag("--colors", "print the palette", [&] { colors = true; });
    h.cli.add_value("--mode", "light|dark", "base palette", store(mode));
    h.cli.add_value("--palette", "file", "palette overrides", store(palette));

    CHECK(h.run({"--colors", "--mode=dark", "--palette", "brand.json"}));
    CHECK_FALSE(h.cli.had_errors());
    CHECK(h.errors.empty());
    CHECK(colors);
    CHECK(mode == "dark");
    CHECK(palette == "brand.json");
}

TEST_CASE("values may look like options when attached or following") {
    Harness h;
    std::string indent;
    h.cli.add_value("--indent", "n", "", store(indent));
    CHECK(h.run({"--indent", "-1"}));
    CHECK(indent == "-1");
    CHECK(h.run({"--indent="}));
    CHECK(indent.empty());
}

TEST_CASE("integer options") {
    Harness h;
    int indent = 2;
    h.cli.add_int("--indent", "n", "JSON indent", [&](int value) -> ToolCli::ParseError {
        if (value < -1) {
            return std::string("--indent must be -1 or larger");
        }
        indent = value;
        return std::nullopt;
    });

    SUBCASE("accepts a number") {
        CHECK(h.run({"--indent=4"}));
        CHECK(indent == 4);
    }
    SUBCASE("rejects trailing garbage") {
        CHECK_FALSE(h.run({"--indent", "4px"}));
        REQUIRE(h.errors.size() == 1);
        CHECK(h.errors.front() == "tonestyle_test: --indent expects an integer, got '4px'");
        CHECK(indent == 2);
    }
    SUBCASE("rejects an empty value") {
        CHECK_FALSE(h.run({"--indent="}));
        CHECK(h.errors.size() == 1);
    }
    SUBCASE("handler messages are reported") {
        CHECK_FALSE(h.run({"--indent=-5"}));
        REQUIRE(h.errors.size() == 1);
        CHECK(h.errors.front() == "tonestyle_test: --indent must be -1 or larger");
    }
}

TEST_CASE("missing value") {
    Harness h("tonestyle_dump");
    std::string mode;
    h.cli.add_value("--mode", "light|dark", "", store(mode));

    CHECK_FALSE(h.run({"--mode"}));
    CHECK(h.cli.had_errors());
    REQUIRE(h.errors.size() == 1);
    CHECK(h.errors.front() == "tonestyle_dump: --mode requires a value");
}

TEST_CASE("flags refuse attached values") {
    Harness h;
    bool all = false;
    h.cli.add_flag("--all", "", [&] { all = true; });

    CHECK_FALSE(h.run({"--all=yes"}));
    CHECK_FALSE(all);
    REQUIRE(h.errors.size() == 1);
    CHECK(h.errors.front() == "tonestyle_test: --all does not take a value");
}

TEST_CASE("every problem is reported") {
    Harness h;
    CHECK_FALSE(h.run({"--mystery", "stray", "-"}));
    REQUIRE(h.errors.size() == 3);
    CHECK(h.errors[0] == "tonestyle_test: unknown option '--mystery'");
    CHECK(h.errors[1] == "tonestyle_test: unexpected argument 'stray'");
    CHECK(h.errors[2] == "tonestyle_test: unexpected argument '-'");
}

TEST_CASE("a positional handler can accept arguments") {
    Harness h;
    std::vector<std::string> files;
    h.cli.set_positional_handler([&](std::string_view token) -> ToolCli::ParseError {
        if (token == "bad") {
            return std::string("cannot use 'bad'");
        }
        files.emplace_back(token);
        return std::nullopt;
    });

    CHECK(h.run({"a.json", "b.json"}));
    CHECK(files == std::vector<std::string>{"a.json", "b.json"});
    CHECK_FALSE(h.run({"bad"}));
    CHECK(h.errors.back() == "tonestyle_test: cannot use 'bad'");
}

TEST_CASE("aliases resolve to their target") {
    Harness h;
    std::string mode;
    h.cli.add_value("--mode", "light|dark", "", store(mode));
    h.cli.add_alias("-m", "--mode");

    CHECK(h.run({"-m", "light"}));
    CHECK(mode == "light");
    CHECK(h.run({"-m=dark"}));
    CHECK(mode == "dark");

    h.cli.add_alias("-x", "--missing");
    REQUIRE(h.errors.size() == 1);
    CHECK(h.errors.front() == "tonestyle_test: alias -x targets unknown option --missing");
}

TEST_CASE("a bad alias keeps every later parse failing") {
    Harness h;
    std::string mode;
    h.cli.add_value("--mode", "light|dark", "", store(mode));
    h.cli.add_alias("-x", "--missing");
    CHECK(h.cli.had_errors());

    CHECK_FALSE(h.run({"--mode", "dark"}));
    CHECK(mode == "dark");
    CHECK(h.cli.had_errors());
    CHECK(h.errors.size() == 1);
}

TEST_CASE("usage lists options in registration order") {
    ToolCli cli("tonestyle_dump");
    cli.add_value("--mode", "light|dark", "base palette", [](std::string_view) -> ToolCli::ParseError { return std::nullopt; });
    cli.add_alias("-m", "--mode");
    cli.add_flag("--all", "", [] {});

    auto text = cli.usage();
    CHECK(text.starts_with("usage: tonestyle_dump [options]\n"));
    CHECK(text.find("  --mode, -m <light|dark>") != std::string::npos);
    CHECK(text.find("base palette") != std::string::npos);
    CHECK(text.find("\n  --all\n") != std::string::npos);
    CHECK(text.find("--mode") < text.find("--all"));
}

} // TEST_SUITE
