#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "daicgate/core/error.hpp"
#include "daicgate/core/types.hpp"

namespace daicgate {

/// Natural-language phrases that drive mode changes, grouped by intent.
struct TriggerPhrases {
    std::vector<std::string> implementation_mode = {"yert", "make it so", "run that"};
    std::vector<std::string> discussion_mode = {"SILENCE"};
    std::vector<std::string> task_creation = {"mek:"};
    std::vector<std::string> task_startup = {"start^"};
    std::vector<std::string> task_completion = {"finito"};
    std::vector<std::string> context_compaction = {"squish"};
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(TriggerPhrases, implementation_mode,
    discussion_mode, task_creation, task_startup, task_completion, context_compaction)

struct BlockedActions {
    std::vector<std::string> implementation_only_tools = {"Edit", "Write", "MultiEdit", "NotebookEdit"};
    std::vector<std::string> bash_read_patterns;
    std::vector<std::string> bash_write_patterns;
    bool extrasafe = true;  // unknown shell commands are write-like
    std::vector<std::string> work_artifact_prefixes = {
        "sessions/", ".claude/", "docs/", "plans/", "notes/", "logs/",
    };

    [[nodiscard]] auto is_tool_blocked(std::string_view tool) const -> bool;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BlockedActions, implementation_only_tools,
    bash_read_patterns, bash_write_patterns, extrasafe, work_artifact_prefixes)

struct Features {
    bool branch_enforcement = true;
    int git_timeout_ms = 2000;
    bool event_log = true;
    bool ci_bypass = false;  // opt-in: skip enforcement when a CI variable is set
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Features, branch_enforcement, git_timeout_ms,
    event_log, ci_bypass)

/// Operator-controlled policy, read on every invocation.
struct PolicyConfig {
    TriggerPhrases trigger_phrases;
    BlockedActions blocked_actions;
    Features features;
    std::string log_level = "warn";

    /// First `count` implementation phrases joined with ", ", for remediation text.
    [[nodiscard]] auto implementation_phrases(std::size_t count = 3) const -> std::string;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PolicyConfig, trigger_phrases, blocked_actions,
    features, log_level)

/// Loads the policy file. A missing file yields the defaults; a file that is
/// present but unreadable, unparseable or of the wrong shape is an
/// InvalidConfig error.
auto load_policy_config(const std::filesystem::path& path) -> Result<PolicyConfig>;

auto default_policy_config() -> PolicyConfig;

} // namespace daicgate
