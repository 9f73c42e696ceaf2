#include <catch2/catch_test_macros.hpp>

#include "daicgate/policy/shell_parser.hpp"

using namespace daicgate::policy;

namespace {

auto bases(const CommandLine& line) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& seg : line.segments) out.push_back(seg.base);
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Segmentation
// ---------------------------------------------------------------------------

TEST_CASE("Command lines split on control operators", "[policy][shell_parser]") {
    auto line = parse_command_line("ls -la | grep foo && cat a; echo done || true & wc -l");
    REQUIRE(line.has_value());
    CHECK(bases(*line) == std::vector<std::string>{"ls", "grep", "cat", "echo", "true", "wc"});
    CHECK(line->segments[0].args == std::vector<std::string>{"-la"});
}

TEST_CASE("Newlines and |& separate commands", "[policy][shell_parser]") {
    auto line = parse_command_line("make 2>&1 |& tee log\nrm -f x");
    REQUIRE(line.has_value());
    CHECK(bases(*line) == std::vector<std::string>{"make", "tee", "rm"});
}

TEST_CASE("Subshell parentheses separate commands", "[policy][shell_parser]") {
    auto line = parse_command_line("(cd src && touch x)");
    REQUIRE(line.has_value());
    CHECK(bases(*line) == std::vector<std::string>{"cd", "touch"});
}

TEST_CASE("Base is the lower-cased file name", "[policy][shell_parser]") {
    auto line = parse_command_line("/usr/bin/RM -rf build");
    REQUIRE(line.has_value());
    REQUIRE(line->segments.size() == 1);
    CHECK(line->segments[0].base == "rm");
    CHECK(line->segments[0].args == std::vector<std::string>{"-rf", "build"});
}

TEST_CASE("Assignments and reserved words are skipped", "[policy][shell_parser]") {
    SECTION("leading assignments") {
        auto line = parse_command_line("FOO=1 BAR+=x make install");
        REQUIRE(line.has_value());
        REQUIRE(line->segments.size() == 1);
        CHECK(line->segments[0].base == "make");
    }

    SECTION("assignment only") {
        auto line = parse_command_line("FOO=bar");
        REQUIRE(line.has_value());
        CHECK(line->segments.empty());
    }

    SECTION("if/then/fi") {
        auto line = parse_command_line("if test -f x; then rm x; fi");
        REQUIRE(line.has_value());
        CHECK(bases(*line) == std::vector<std::string>{"test", "rm"});
    }

    SECTION("for loop header runs nothing") {
        auto line = parse_command_line("for f in a b; do touch $f; done");
        REQUIRE(line.has_value());
        CHECK(bases(*line) == std::vector<std::string>{"touch"});
    }
}

// ---------------------------------------------------------------------------
// Quoting
// ---------------------------------------------------------------------------

TEST_CASE("Quotes keep operators literal", "[policy][shell_parser]") {
    SECTION("single quotes") {
        auto line = parse_command_line("grep 'a | b; c' file");
        REQUIRE(line.has_value());
        REQUIRE(line->segments.size() == 1);
        CHECK(line->segments[0].args == std::vector<std::string>{"a | b; c", "file"});
    }

    SECTION("double quotes with escapes") {
        auto line = parse_command_line(R"(echo "say \"hi\" && go")");
        REQUIRE(line.has_value());
        REQUIRE(line->segments.size() == 1);
        CHECK(line->segments[0].args == std::vector<std::string>{R"(say "hi" && go)"});
    }

    SECTION("empty quotes form a word") {
        auto line = parse_command_line("git commit -m ''");
        REQUIRE(line.has_value());
        CHECK(line->segments[0].args.size() == 3);
    }

    SECTION("backslash escapes an operator") {
        auto line = parse_command_line(R"(echo a\;b)");
        REQUIRE(line.has_value());
        REQUIRE(line->segments.size() == 1);
        CHECK(line->segments[0].args == std::vector<std::string>{"a;b"});
    }
}

TEST_CASE("Comments end the line", "[policy][shell_parser]") {
    auto line = parse_command_line("ls # && rm -rf /");
    REQUIRE(line.has_value());
    CHECK(bases(*line) == std::vector<std::string>{"ls"});

    auto hash_in_word = parse_command_line("echo a#b");
    REQUIRE(hash_in_word.has_value());
    CHECK(hash_in_word->segments[0].args == std::vector<std::string>{"a#b"});
}

// ---------------------------------------------------------------------------
// Substitutions
// ---------------------------------------------------------------------------

TEST_CASE("Substitutions are captured", "[policy][shell_parser]") {
    SECTION("dollar-paren") {
        auto line = parse_command_line("echo $(rm -rf x)");
        REQUIRE(line.has_value());
        CHECK(line->substitutions == std::vector<std::string>{"rm -rf x"});
        CHECK(bases(*line) == std::vector<std::string>{"echo"});
    }

    SECTION("backticks") {
        auto line = parse_command_line("echo `touch y`");
        REQUIRE(line.has_value());
        CHECK(line->substitutions == std::vector<std::string>{"touch y"});
    }

    SECTION("inside double quotes") {
        auto line = parse_command_line(R"(echo "today is $(date)")");
        REQUIRE(line.has_value());
        CHECK(line->substitutions == std::vector<std::string>{"date"});
    }

    SECTION("single quotes suppress substitution") {
        auto line = parse_command_line("echo '$(rm x)'");
        REQUIRE(line.has_value());
        CHECK(line->substitutions.empty());
    }

    SECTION("process substitution") {
        auto line = parse_command_line("diff <(ls a) <(ls b)");
        REQUIRE(line.has_value());
        CHECK(line->substitutions == std::vector<std::string>{"ls a", "ls b"});
        REQUIRE(line->segments.size() == 1);
        CHECK(line->segments[0].base == "diff");
    }

    SECTION("nested substitution stays in its parent") {
        auto line = parse_command_line("echo $(cat $(ls))");
        REQUIRE(line.has_value());
        CHECK(line->substitutions == std::vector<std::string>{"cat $(ls)"});
    }

    SECTION("arithmetic is not a command") {
        auto line = parse_command_line("echo $((1 + 2))");
        REQUIRE(line.has_value());
        CHECK(line->substitutions.empty());
    }

    SECTION("parameter expansion is plain text") {
        auto line = parse_command_line("echo ${HOME}");
        REQUIRE(line.has_value());
        CHECK(line->substitutions.empty());
        CHECK(line->segments[0].args == std::vector<std::string>{"${HOME}"});
    }
}

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

TEST_CASE("Malformed command lines are rejected", "[policy][shell_parser]") {
    CHECK_FALSE(parse_command_line("echo 'unterminated").has_value());
    CHECK_FALSE(parse_command_line("echo \"unterminated").has_value());
    CHECK_FALSE(parse_command_line("echo trailing\\").has_value());
    CHECK_FALSE(parse_command_line("echo $(ls").has_value());
    CHECK_FALSE(parse_command_line("echo `ls").has_value());

    auto err = parse_command_line("echo 'x");
    REQUIRE_FALSE(err.has_value());
    CHECK(err.error().code() == daicgate::ErrorCode::InvalidArgument);
}

// ---------------------------------------------------------------------------
// has_output_redirection
// ---------------------------------------------------------------------------

TEST_CASE("Output redirection detection respects quoting", "[policy][shell_parser]") {
    CHECK(has_output_redirection("echo hi > out.txt"));
    CHECK(has_output_redirection("echo hi >> out.txt"));
    CHECK(has_output_redirection("cmd 2>&1"));
    CHECK(has_output_redirection("cmd &> log"));
    CHECK(has_output_redirection("tee >(cat)"));

    CHECK_FALSE(has_output_redirection("grep '>' file"));
    CHECK_FALSE(has_output_redirection(R"(grep "a > b" file)"));
    CHECK_FALSE(has_output_redirection(R"(echo a\>b)"));
    CHECK_FALSE(has_output_redirection("cat < in.txt"));
}

TEST_CASE("make_shell_command splits base and args", "[policy][shell_parser]") {
    auto cmd = make_shell_command({"./Scripts/Build.sh", "--fast"});
    CHECK(cmd.base == "build.sh");
    CHECK(cmd.args == std::vector<std::string>{"--fast"});

    CHECK(make_shell_command({}).base.empty());
}
