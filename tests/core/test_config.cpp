#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

#include "daicgate/core/config.hpp"

namespace fs = std::filesystem;

namespace {

// RAII helper: a scratch file removed on destruction.
struct TmpConfigFile {
    fs::path path;
    explicit TmpConfigFile(const char* name)
        : path(fs::temp_directory_path() / name) {
        fs::remove(path);
    }
    ~TmpConfigFile() {
        std::error_code ec;
        fs::remove(path, ec);
    }
    void write(const std::string& content) const {
        std::ofstream out(path);
        out << content;
    }
};

} // namespace

TEST_CASE("default_policy_config returns sane defaults", "[config]") {
    auto cfg = daicgate::default_policy_config();

    SECTION("trigger phrases") {
        REQUIRE(cfg.trigger_phrases.implementation_mode.size() == 3);
        CHECK(cfg.trigger_phrases.implementation_mode[0] == "yert");
        CHECK(cfg.trigger_phrases.discussion_mode == std::vector<std::string>{"SILENCE"});
        CHECK(cfg.trigger_phrases.task_creation == std::vector<std::string>{"mek:"});
        CHECK(cfg.trigger_phrases.task_startup == std::vector<std::string>{"start^"});
        CHECK(cfg.trigger_phrases.task_completion == std::vector<std::string>{"finito"});
        CHECK(cfg.trigger_phrases.context_compaction == std::vector<std::string>{"squish"});
    }

    SECTION("blocked actions") {
        CHECK(cfg.blocked_actions.extrasafe);
        CHECK(cfg.blocked_actions.is_tool_blocked("Write"));
        CHECK(cfg.blocked_actions.is_tool_blocked("NotebookEdit"));
        CHECK_FALSE(cfg.blocked_actions.is_tool_blocked("Read"));
        CHECK(cfg.blocked_actions.bash_read_patterns.empty());
        CHECK(cfg.blocked_actions.bash_write_patterns.empty());
    }

    SECTION("features") {
        CHECK(cfg.features.branch_enforcement);
        CHECK(cfg.features.git_timeout_ms == 2000);
        CHECK(cfg.features.event_log);
        CHECK_FALSE(cfg.features.ci_bypass);
    }

    SECTION("log level") {
        CHECK(cfg.log_level == "warn");
    }
}

TEST_CASE("implementation_phrases joins the first phrases", "[config]") {
    auto cfg = daicgate::default_policy_config();
    CHECK(cfg.implementation_phrases() == "yert, make it so, run that");
    CHECK(cfg.implementation_phrases(1) == "yert");

    cfg.trigger_phrases.implementation_mode.clear();
    CHECK(cfg.implementation_phrases() == "");
}

TEST_CASE("load_policy_config with a missing file yields defaults", "[config]") {
    TmpConfigFile tmp("daicgate_test_config_missing.json");

    auto cfg = daicgate::load_policy_config(tmp.path);
    REQUIRE(cfg.has_value());
    CHECK(cfg->features.git_timeout_ms == 2000);
    CHECK(cfg->blocked_actions.extrasafe);
}

TEST_CASE("load_policy_config parses partial documents", "[config]") {
    TmpConfigFile tmp("daicgate_test_config_partial.json");
    tmp.write(R"({
        "trigger_phrases": {"implementation_mode": ["go ahead"]},
        "blocked_actions": {"extrasafe": false, "bash_read_patterns": ["terraform"]},
        "features": {"branch_enforcement": false},
        "log_level": "debug"
    })");

    auto cfg = daicgate::load_policy_config(tmp.path);
    REQUIRE(cfg.has_value());

    CHECK(cfg->trigger_phrases.implementation_mode == std::vector<std::string>{"go ahead"});
    // Keys left out keep their defaults
    CHECK(cfg->trigger_phrases.discussion_mode == std::vector<std::string>{"SILENCE"});
    CHECK_FALSE(cfg->blocked_actions.extrasafe);
    CHECK(cfg->blocked_actions.bash_read_patterns == std::vector<std::string>{"terraform"});
    CHECK(cfg->blocked_actions.is_tool_blocked("Edit"));
    CHECK_FALSE(cfg->features.branch_enforcement);
    CHECK(cfg->features.git_timeout_ms == 2000);
    CHECK(cfg->log_level == "debug");
}

TEST_CASE("load_policy_config rejects malformed files", "[config]") {
    TmpConfigFile tmp("daicgate_test_config_bad.json");

    SECTION("invalid JSON") {
        tmp.write("{ not json");
        auto cfg = daicgate::load_policy_config(tmp.path);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error().code() == daicgate::ErrorCode::InvalidConfig);
    }

    SECTION("root is not an object") {
        tmp.write("[1, 2, 3]");
        auto cfg = daicgate::load_policy_config(tmp.path);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error().code() == daicgate::ErrorCode::InvalidConfig);
    }

    SECTION("wrong value type") {
        tmp.write(R"({"blocked_actions": {"extrasafe": "yes"}})");
        auto cfg = daicgate::load_policy_config(tmp.path);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error().code() == daicgate::ErrorCode::InvalidConfig);
    }

    SECTION("non-positive git timeout") {
        tmp.write(R"({"features": {"git_timeout_ms": 0}})");
        auto cfg = daicgate::load_policy_config(tmp.path);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error().code() == daicgate::ErrorCode::InvalidConfig);
    }
}

TEST_CASE("PolicyConfig round-trips through JSON", "[config]") {
    auto cfg = daicgate::default_policy_config();
    cfg.features.ci_bypass = true;
    cfg.blocked_actions.work_artifact_prefixes = {"notes/"};

    nlohmann::json j = cfg;
    auto back = j.get<daicgate::PolicyConfig>();
    CHECK(back.features.ci_bypass);
    CHECK(back.blocked_actions.work_artifact_prefixes == std::vector<std::string>{"notes/"});
    CHECK(j["trigger_phrases"]["task_completion"][0] == "finito");
}
