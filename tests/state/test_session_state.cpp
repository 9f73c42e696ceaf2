#include <catch2/catch_test_macros.hpp>

#include "daicgate/state/session_state.hpp"

using namespace daicgate;
using namespace daicgate::state;

namespace {

auto item(const char* content, WorkItemStatus status = WorkItemStatus::Pending) -> WorkItem {
    return WorkItem{content, status, {}};
}

} // namespace

TEST_CASE("Work item status names", "[state]") {
    CHECK(status_to_string(WorkItemStatus::Pending) == "pending");
    CHECK(status_to_string(WorkItemStatus::InProgress) == "in_progress");
    CHECK(status_to_string(WorkItemStatus::Completed) == "completed");

    CHECK(parse_status("in_progress") == WorkItemStatus::InProgress);
    CHECK_FALSE(parse_status("done").has_value());
    CHECK_FALSE(parse_status("Pending").has_value());
}

TEST_CASE("WorkItems stash and restore", "[state]") {
    WorkItems items;
    items.active = {item("write parser"), item("add tests")};

    SECTION("stash moves the active list") {
        CHECK(items.stash_active() == 2);
        CHECK(items.active.empty());
        CHECK(items.contents(WorkList::Stashed) ==
              std::vector<std::string>{"write parser", "add tests"});
    }

    SECTION("an occupied stash is never overwritten") {
        items.stashed = {item("older work")};
        CHECK(items.stash_active() == 0);
        CHECK(items.active.size() == 2);
        CHECK(items.contents(WorkList::Stashed) == std::vector<std::string>{"older work"});
    }

    SECTION("restore replaces the active list") {
        items.stash_active();
        items.active = {item("plan step")};
        CHECK(items.restore_stashed() == 2);
        CHECK(items.stashed.empty());
        CHECK(items.contents(WorkList::Active) ==
              std::vector<std::string>{"write parser", "add tests"});
    }
}

TEST_CASE("Flags default to false", "[state]") {
    SessionState state;
    CHECK_FALSE(state.bypass_mode());
    CHECK_FALSE(state.flag("anything"));

    state.set_flag(kBypassFlag, true);
    CHECK(state.bypass_mode());
    state.set_flag(kBypassFlag, false);
    CHECK_FALSE(state.bypass_mode());
}

TEST_CASE("CurrentTask is active when it names a branch", "[state]") {
    CurrentTask task;
    CHECK_FALSE(task.is_active());
    task.name = "m-fix-login";
    CHECK_FALSE(task.is_active());
    task.branch = "fix/login";
    CHECK(task.is_active());
}

TEST_CASE("state_to_json writes the full document", "[state][json]") {
    SessionState state;
    state.mode = Mode::Implementation;
    state.current_task.name = "m-fix-login";
    state.current_task.branch = "fix/login";
    state.current_task.submodules = {"api"};
    state.todos.active = {WorkItem{"write parser", WorkItemStatus::InProgress, "Writing parser"}};

    auto j = state_to_json(state);
    CHECK(j["mode"] == "implementation");
    CHECK(j["current_task"]["branch"] == "fix/login");
    CHECK(j["current_task"]["submodules"][0] == "api");
    CHECK(j["todos"]["active"][0]["status"] == "in_progress");
    CHECK(j["todos"]["active"][0]["activeForm"] == "Writing parser");
    CHECK(j["todos"]["stashed"].empty());
    CHECK(j["flags"]["bypass_mode"] == false);
    CHECK(j["metadata"].is_object());

    auto back = state_from_json(j);
    REQUIRE(back.has_value());
    CHECK(back->mode == Mode::Implementation);
    CHECK(back->current_task.submodules == std::vector<std::string>{"api"});
    CHECK(back->todos.active == state.todos.active);
}

TEST_CASE("state_from_json fills in missing keys", "[state][json]") {
    auto state = state_from_json(json{{"mode", "plan"}});
    REQUIRE(state.has_value());
    CHECK(state->mode == Mode::Plan);
    CHECK_FALSE(state->current_task.is_active());
    CHECK(state->todos.active.empty());
    CHECK_FALSE(state->bypass_mode());

    auto empty = state_from_json(json::object());
    REQUIRE(empty.has_value());
    CHECK(empty->mode == Mode::Discussion);
}

TEST_CASE("state_from_json rejects malformed documents", "[state][json]") {
    auto check_corrupted = [](const json& j) {
        auto state = state_from_json(j);
        REQUIRE_FALSE(state.has_value());
        CHECK(state.error().code() == ErrorCode::CorruptedState);
    };

    SECTION("root is not an object") { check_corrupted(json::array()); }
    SECTION("unknown mode") { check_corrupted(json{{"mode", "coding"}}); }
    SECTION("mode of the wrong type") { check_corrupted(json{{"mode", 3}}); }
    SECTION("task field of the wrong type") {
        check_corrupted(json{{"current_task", {{"branch", 42}}}});
    }
    SECTION("submodules not an array") {
        check_corrupted(json{{"current_task", {{"submodules", "api"}}}});
    }
    SECTION("work item without content") {
        check_corrupted(json::parse(R"({"todos": {"active": [{"status": "pending"}]}})"));
    }
    SECTION("flag that is not a boolean") {
        check_corrupted(json{{"flags", {{"bypass_mode", "yes"}}}});
    }
    SECTION("metadata not an object") { check_corrupted(json{{"metadata", 1}}); }
}

TEST_CASE("work_items_from_json validates submitted lists", "[state][json]") {
    SECTION("valid list") {
        auto items = work_items_from_json(json::parse(R"([
            {"content": "a", "status": "completed", "activeForm": "Doing a"},
            {"content": "b"}
        ])"));
        REQUIRE(items.has_value());
        REQUIRE(items->size() == 2);
        CHECK((*items)[0].status == WorkItemStatus::Completed);
        CHECK((*items)[0].active_form == "Doing a");
        CHECK((*items)[1].status == WorkItemStatus::Pending);
    }

    SECTION("not an array") {
        auto items = work_items_from_json(json{{"content", "a"}});
        REQUIRE_FALSE(items.has_value());
        CHECK(items.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("unknown status names the index") {
        auto items = work_items_from_json(json::parse(R"([
            {"content": "a"}, {"content": "b", "status": "blocked"}
        ])"));
        REQUIRE_FALSE(items.has_value());
        CHECK(items.error().code() == ErrorCode::InvalidArgument);
        CHECK(items.error().detail() == "index 1");
    }
}
