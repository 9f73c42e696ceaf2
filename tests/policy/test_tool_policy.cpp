#include <catch2/catch_test_macros.hpp>

#include <filesystem>

#include "daicgate/policy/tool_policy.hpp"

namespace fs = std::filesystem;
using namespace daicgate;
using namespace daicgate::policy;

namespace {

struct TmpDir {
    fs::path path;
    explicit TmpDir(const char* name)
        : path(fs::temp_directory_path() / name) {
        fs::remove_all(path);
        fs::create_directories(path / "sessions");
        path = fs::canonical(path);
    }
    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

} // namespace

TEST_CASE("Protected paths", "[policy][tool_policy]") {
    TmpDir tmp("daicgate_test_tool_policy_protected");
    PolicyConfig config;
    ToolPolicy policy(tmp.path, config);

    CHECK(policy.is_protected_path(tmp.path / "sessions" / "sessions-state.json"));
    CHECK(policy.is_protected_path(tmp.path / "sessions" / "sessions-config.json"));
    CHECK(policy.is_protected_path(tmp.path / "sessions" / ".." / "sessions" / "sessions-state.json"));
    CHECK(policy.is_protected_path("/elsewhere/checkout/sessions/sessions-state.json"));

    CHECK_FALSE(policy.is_protected_path(tmp.path / "sessions" / "tasks" / "t.md"));
    CHECK_FALSE(policy.is_protected_path(tmp.path / "sessions-state.json"));
    CHECK_FALSE(policy.is_protected_path(tmp.path / "src" / "main.cpp"));
}

TEST_CASE("Shell commands naming protected files", "[policy][tool_policy]") {
    PolicyConfig config;
    ToolPolicy policy("/project", config);

    CHECK(policy.mentions_protected_file("cat sessions/sessions-state.json"));
    CHECK(policy.mentions_protected_file("echo '{}' > sessions/sessions-config.json"));
    CHECK_FALSE(policy.mentions_protected_file("ls sessions/"));

    SECTION("globs and braces under sessions") {
        CHECK(policy.mentions_protected_file("rm sessions/sessions-st*.json"));
        CHECK(policy.mentions_protected_file("cp /tmp/x sessions/sessions-st?te.json"));
        CHECK(policy.mentions_protected_file("rm -f sessions/*"));
        CHECK(policy.mentions_protected_file("mv x 'sessions/sessions-[sc]*'"));
        CHECK(policy.mentions_protected_file("rm sessions/sessions-{state,x}.json"));
        CHECK(policy.mentions_protected_file("cd sessions && rm sessions-*.json"));
    }

    SECTION("globs that cannot reach the protected files") {
        CHECK_FALSE(policy.mentions_protected_file("rm sessions/tasks/*.md"));
        CHECK_FALSE(policy.mentions_protected_file("rm build/*.json"));
        CHECK_FALSE(policy.mentions_protected_file("ls sessions/*.log"));
    }
}

TEST_CASE("Operator state commands are recognised", "[policy][tool_policy]") {
    PolicyConfig config;
    ToolPolicy policy("/project", config);

    SECTION("direct invocations") {
        CHECK(policy.invokes_state_command("daicgate state bypass on"));
        CHECK(policy.invokes_state_command("daicgate state mode implementation"));
        CHECK(policy.invokes_state_command("/usr/local/bin/daicgate -C . state reset"));
        CHECK(policy.invokes_state_command("ls && daicgate state task --clear"));
    }

    SECTION("hidden in scripts and substitutions") {
        CHECK(policy.invokes_state_command("bash -c \"daicgate state bypass on\""));
        CHECK(policy.invokes_state_command("sh -c 'cd /tmp; daicgate state reset'"));
        CHECK(policy.invokes_state_command("echo $(daicgate state mode discussion)"));
        CHECK(policy.invokes_state_command("echo `daicgate state bypass off`"));
    }

    SECTION("unparseable commands mentioning the program") {
        CHECK(policy.invokes_state_command("daicgate state 'mode"));
    }

    SECTION("read-only and unrelated commands") {
        CHECK_FALSE(policy.invokes_state_command("daicgate state show"));
        CHECK_FALSE(policy.invokes_state_command("daicgate classify rm -rf build"));
        CHECK_FALSE(policy.invokes_state_command("echo daicgate"));
        CHECK_FALSE(policy.invokes_state_command("git status"));
        CHECK_FALSE(policy.invokes_state_command("ls 'unterminated"));
    }
}

TEST_CASE("Work artifacts", "[policy][tool_policy]") {
    TmpDir tmp("daicgate_test_tool_policy_artifacts");
    PolicyConfig config;
    ToolPolicy policy(tmp.path, config);

    CHECK(policy.is_work_artifact(tmp.path / "docs" / "design.md"));
    CHECK(policy.is_work_artifact(tmp.path / "sessions" / "tasks" / "t.md"));
    CHECK(policy.is_work_artifact(tmp.path / "plans" / "nested" / "p.md"));

    CHECK_FALSE(policy.is_work_artifact(tmp.path / "src" / "main.cpp"));
    CHECK_FALSE(policy.is_work_artifact(tmp.path / "docs.md"));
    CHECK_FALSE(policy.is_work_artifact(tmp.path / ".." / "docs" / "x.md"));
    CHECK_FALSE(policy.is_work_artifact("/somewhere/else/docs/x.md"));

    SECTION("custom prefixes without a trailing slash") {
        config.blocked_actions.work_artifact_prefixes = {"design"};
        CHECK(policy.is_work_artifact(tmp.path / "design" / "a.md"));
        CHECK_FALSE(policy.is_work_artifact(tmp.path / "designer" / "a.md"));
        CHECK_FALSE(policy.is_work_artifact(tmp.path / "docs" / "a.md"));
    }
}

TEST_CASE("Tools blocked while locked", "[policy][tool_policy]") {
    PolicyConfig config;
    ToolPolicy policy("/project", config);

    CHECK(policy.is_blocked_while_locked("Edit"));
    CHECK(policy.is_blocked_while_locked("NotebookEdit"));
    CHECK_FALSE(policy.is_blocked_while_locked("Read"));
    CHECK_FALSE(policy.is_blocked_while_locked("Bash"));
}
