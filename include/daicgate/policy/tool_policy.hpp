#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_set>

#include "daicgate/core/config.hpp"

namespace daicgate::policy {

/// Path- and tool-level rules that do not depend on the workflow mode.
///
/// Protected resources are the session state and policy files: only this
/// program may write them. Work artifacts are files under the configured
/// prefixes (plans, notes, docs...) that stay writable while the workflow is
/// locked to discussion.
class ToolPolicy {
public:
    ToolPolicy(std::filesystem::path project_root, const PolicyConfig& config);

    /// True when `target` is the state file or the config file of this
    /// project, or any `sessions/sessions-state.json` / `sessions-config.json`.
    [[nodiscard]] auto is_protected_path(const std::filesystem::path& target) const -> bool;

    /// True when a shell command names one of the protected files, literally
    /// or through a glob under `sessions` (`sessions/*`, `sessions/sessions-st?te.json`).
    [[nodiscard]] auto mentions_protected_file(std::string_view command) const -> bool;

    /// True when a shell command runs one of this program's state-changing
    /// operator commands (`daicgate state mode|task|bypass|reset`), directly,
    /// through a wrapper or inside a substitution. Unparseable commands that
    /// mention the program count as well.
    [[nodiscard]] auto invokes_state_command(std::string_view command) const -> bool;

    /// True when `target` lies inside the project under a work-artifact prefix.
    [[nodiscard]] auto is_work_artifact(const std::filesystem::path& target) const -> bool;

    /// True for tools listed in `implementation_only_tools`.
    [[nodiscard]] auto is_blocked_while_locked(std::string_view tool) const -> bool;

    /// File names of the protected resources.
    [[nodiscard]] static auto protected_file_names() -> const std::unordered_set<std::string>&;

private:
    std::filesystem::path project_root_;
    const PolicyConfig& config_;
};

} // namespace daicgate::policy
