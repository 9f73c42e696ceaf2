#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "daicgate/core/error.hpp"
#include "daicgate/core/types.hpp"

namespace daicgate::state {

enum class WorkItemStatus {
    Pending,
    InProgress,
    Completed,
};

/// "pending", "in_progress", "completed".
auto status_to_string(WorkItemStatus status) -> std::string_view;
auto parse_status(std::string_view name) -> std::optional<WorkItemStatus>;

/// One entry of the agent's approved work list.
struct WorkItem {
    std::string content;
    WorkItemStatus status = WorkItemStatus::Pending;
    std::string active_form;

    auto operator==(const WorkItem&) const -> bool = default;
};

enum class WorkList {
    Active,
    Stashed,
};

struct WorkItems {
    std::vector<WorkItem> active;
    std::vector<WorkItem> stashed;

    /// Moves the active list into the stash when the stash is empty.
    /// Returns the number of items moved.
    auto stash_active() -> std::size_t;

    /// Replaces the active list with the stash and empties it.
    /// Returns the number of items restored.
    auto restore_stashed() -> std::size_t;

    void clear_active() { active.clear(); }

    /// Ordered descriptions of one list; statuses are not part of the identity.
    [[nodiscard]] auto contents(WorkList list) const -> std::vector<std::string>;
};

struct CurrentTask {
    std::string name;
    std::string file;
    std::string branch;
    std::vector<std::string> submodules;

    /// A task is active when it names a branch.
    [[nodiscard]] auto is_active() const -> bool { return !branch.empty(); }
};

inline constexpr std::string_view kBypassFlag = "bypass_mode";

/// The persisted workflow state of one project.
struct SessionState {
    Mode mode = Mode::Discussion;
    CurrentTask current_task;
    WorkItems todos;
    std::map<std::string, bool> flags;
    json metadata = json::object();

    [[nodiscard]] auto flag(std::string_view name) const -> bool;
    void set_flag(std::string_view name, bool value);

    [[nodiscard]] auto bypass_mode() const -> bool { return flag(kBypassFlag); }
};

auto work_item_to_json(const WorkItem& item) -> json;
auto state_to_json(const SessionState& state) -> json;

/// Parses one work item. `content` must be a string; `status` defaults to
/// pending and must otherwise be a known status; `activeForm` is optional.
auto work_item_from_json(const json& j) -> Result<WorkItem>;

/// Parses an array of work items; anything else is an InvalidArgument error.
auto work_items_from_json(const json& j) -> Result<std::vector<WorkItem>>;

/// Parses the state document. Missing keys take their defaults; keys of the
/// wrong type or unknown enumerators are a CorruptedState error.
auto state_from_json(const json& j) -> Result<SessionState>;

} // namespace daicgate::state
