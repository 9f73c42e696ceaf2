#include <catch2/catch_test_macros.hpp>

#include "daicgate/mediator/request.hpp"

using namespace daicgate;
using namespace daicgate::mediator;

TEST_CASE("Tool requests are parsed from hook payloads", "[mediator][request]") {
    auto request = parse_tool_request(std::string_view(R"({
        "session_id": "abc",
        "hook_event_name": "PreToolUse",
        "tool_name": "Edit",
        "tool_input": {"file_path": "src/main.cpp", "old_string": "a", "new_string": "b"},
        "cwd": "/work/project"
    })"));
    REQUIRE(request.has_value());
    CHECK(request->tool_name == "Edit");
    REQUIRE(request->cwd.has_value());
    CHECK(*request->cwd == "/work/project");
    CHECK(request->raw_target() == "src/main.cpp");
    CHECK(request->target_path("/other") == std::filesystem::path("/work/project/src/main.cpp"));
    CHECK(request->command().empty());
}

TEST_CASE("Tool request defaults", "[mediator][request]") {
    auto request = parse_tool_request(std::string_view(R"({"tool_name": "Bash"})"));
    REQUIRE(request.has_value());
    CHECK(request->tool_input.is_object());
    CHECK(request->tool_input.empty());
    CHECK_FALSE(request->cwd.has_value());
    CHECK_FALSE(request->raw_target().has_value());
    CHECK_FALSE(request->target_path("/project").has_value());

    SECTION("null fields count as absent") {
        auto nulls = parse_tool_request(
            std::string_view(R"({"tool_name": "Read", "tool_input": null, "cwd": null})"));
        REQUIRE(nulls.has_value());
        CHECK(nulls->tool_input.empty());
    }
}

TEST_CASE("Tool request targets", "[mediator][request]") {
    ToolRequest request;
    request.tool_name = "NotebookEdit";

    SECTION("file_path wins over the other keys") {
        request.tool_input = {{"file_path", "a.txt"}, {"notebook_path", "b.ipynb"}};
        CHECK(request.raw_target() == "a.txt");
    }

    SECTION("notebook_path then path") {
        request.tool_input = {{"file_path", ""}, {"notebook_path", "b.ipynb"}};
        CHECK(request.raw_target() == "b.ipynb");
        request.tool_input = {{"path", "dir"}};
        CHECK(request.raw_target() == "dir");
    }

    SECTION("relative paths resolve against the project root without cwd") {
        request.tool_input = {{"path", "docs/../src/x.cpp"}};
        CHECK(request.target_path("/project") == std::filesystem::path("/project/src/x.cpp"));
    }

    SECTION("absolute paths are kept") {
        request.tool_input = {{"file_path", "/etc/hosts"}};
        CHECK(request.target_path("/project") == std::filesystem::path("/etc/hosts"));
    }

    SECTION("non-string values are ignored") {
        request.tool_input = {{"file_path", 42}, {"command", json::array()}};
        CHECK_FALSE(request.raw_target().has_value());
        CHECK(request.command().empty());
    }
}

TEST_CASE("Malformed tool requests", "[mediator][request]") {
    const char* cases[] = {
        "not json",
        "[1, 2]",
        R"({"tool_input": {}})",
        R"({"tool_name": ""})",
        R"({"tool_name": 7})",
        R"({"tool_name": "Bash", "tool_input": "ls"})",
        R"({"tool_name": "Bash", "cwd": 3})",
    };
    for (const auto* text : cases) {
        auto request = parse_tool_request(std::string_view(text));
        INFO(text);
        REQUIRE_FALSE(request.has_value());
        CHECK(request.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Prompt requests", "[mediator][request]") {
    auto ok = parse_prompt_request(R"({"prompt": "yert", "session_id": "s"})");
    REQUIRE(ok.has_value());
    CHECK(ok->prompt == "yert");

    CHECK_FALSE(parse_prompt_request("{}").has_value());
    CHECK_FALSE(parse_prompt_request(R"({"prompt": 1})").has_value());
    CHECK_FALSE(parse_prompt_request("\"yert\"").has_value());
    CHECK_FALSE(parse_prompt_request("{").has_value());
}
