#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace daicgate {

using json = nlohmann::json;

/// Workflow mode. Discussion is the initial mode of every project.
enum class Mode {
    Discussion,
    Plan,
    Implementation,
};

/// Wire name used in the state file ("discussion", "plan", "implementation").
auto mode_to_string(Mode mode) -> std::string_view;

/// Strict inverse of mode_to_string; unknown names yield nullopt.
auto parse_mode(std::string_view name) -> std::optional<Mode>;

/// Title-cased name for user-facing messages.
auto mode_display_name(Mode mode) -> std::string_view;

/// Tool identities the host presents to the hook.
namespace tools {
    inline constexpr std::string_view kBash = "Bash";
    inline constexpr std::string_view kWrite = "Write";
    inline constexpr std::string_view kEdit = "Edit";
    inline constexpr std::string_view kMultiEdit = "MultiEdit";
    inline constexpr std::string_view kNotebookEdit = "NotebookEdit";
    inline constexpr std::string_view kTodoWrite = "TodoWrite";
    inline constexpr std::string_view kEnterPlanMode = "EnterPlanMode";
    inline constexpr std::string_view kExitPlanMode = "ExitPlanMode";

    /// Tools that write a file named by their input.
    inline auto is_file_mutating(std::string_view tool) -> bool {
        return tool == kWrite || tool == kEdit || tool == kMultiEdit ||
               tool == kNotebookEdit;
    }
} // namespace tools

} // namespace daicgate
