#include "daicgate/state/session_state.hpp"

namespace daicgate::state {

namespace {

auto corrupted(std::string message) -> Error {
    return make_error(ErrorCode::CorruptedState, std::move(message));
}

auto string_field(const json& obj, std::string_view key, std::string& out) -> bool {
    auto it = obj.find(std::string(key));
    if (it == obj.end() || it->is_null()) return true;
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

auto parse_item_list(const json& obj, std::string_view key, std::vector<WorkItem>& out)
    -> VoidResult {
    auto it = obj.find(std::string(key));
    if (it == obj.end() || it->is_null()) return {};
    auto items = work_items_from_json(*it);
    if (!items) {
        return std::unexpected(corrupted("todos." + std::string(key) + ": " +
                                         items.error().what()));
    }
    out = std::move(*items);
    return {};
}

auto parse_task(const json& j) -> Result<CurrentTask> {
    CurrentTask task;
    if (j.is_null()) return task;
    if (!j.is_object()) return std::unexpected(corrupted("current_task must be an object"));

    if (!string_field(j, "name", task.name) || !string_field(j, "file", task.file) ||
        !string_field(j, "branch", task.branch)) {
        return std::unexpected(corrupted("current_task fields must be strings"));
    }

    if (auto it = j.find("submodules"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            return std::unexpected(corrupted("current_task.submodules must be an array"));
        }
        for (const auto& name : *it) {
            if (!name.is_string()) {
                return std::unexpected(corrupted("current_task.submodules must hold strings"));
            }
            task.submodules.push_back(name.get<std::string>());
        }
    }
    return task;
}

} // anonymous namespace

auto status_to_string(WorkItemStatus status) -> std::string_view {
    switch (status) {
        case WorkItemStatus::Pending: return "pending";
        case WorkItemStatus::InProgress: return "in_progress";
        case WorkItemStatus::Completed: return "completed";
    }
    return "pending";
}

auto parse_status(std::string_view name) -> std::optional<WorkItemStatus> {
    if (name == "pending") return WorkItemStatus::Pending;
    if (name == "in_progress") return WorkItemStatus::InProgress;
    if (name == "completed") return WorkItemStatus::Completed;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// WorkItems
// ---------------------------------------------------------------------------

auto WorkItems::stash_active() -> std::size_t {
    if (!stashed.empty() || active.empty()) return 0;
    auto count = active.size();
    stashed = std::move(active);
    active.clear();
    return count;
}

auto WorkItems::restore_stashed() -> std::size_t {
    auto count = stashed.size();
    active = std::move(stashed);
    stashed.clear();
    return count;
}

auto WorkItems::contents(WorkList list) const -> std::vector<std::string> {
    const auto& items = (list == WorkList::Active) ? active : stashed;
    std::vector<std::string> result;
    result.reserve(items.size());
    for (const auto& item : items) {
        result.push_back(item.content);
    }
    return result;
}

// ---------------------------------------------------------------------------
// SessionState
// ---------------------------------------------------------------------------

auto SessionState::flag(std::string_view name) const -> bool {
    auto it = flags.find(std::string(name));
    return it != flags.end() && it->second;
}

void SessionState::set_flag(std::string_view name, bool value) {
    flags[std::string(name)] = value;
}

// ---------------------------------------------------------------------------
// Serialisation
// ---------------------------------------------------------------------------

auto work_item_to_json(const WorkItem& item) -> json {
    json j = {
        {"content", item.content},
        {"status", std::string(status_to_string(item.status))},
    };
    if (!item.active_form.empty()) {
        j["activeForm"] = item.active_form;
    }
    return j;
}

auto state_to_json(const SessionState& state) -> json {
    json active = json::array();
    for (const auto& item : state.todos.active) active.push_back(work_item_to_json(item));
    json stashed = json::array();
    for (const auto& item : state.todos.stashed) stashed.push_back(work_item_to_json(item));

    json flags = json::object();
    for (const auto& [name, value] : state.flags) flags[name] = value;
    if (!flags.contains(std::string(kBypassFlag))) flags[std::string(kBypassFlag)] = false;

    return json{
        {"mode", std::string(mode_to_string(state.mode))},
        {"current_task", {
            {"name", state.current_task.name},
            {"file", state.current_task.file},
            {"branch", state.current_task.branch},
            {"submodules", state.current_task.submodules},
        }},
        {"todos", {{"active", active}, {"stashed", stashed}}},
        {"flags", flags},
        {"metadata", state.metadata.is_object() ? state.metadata : json::object()},
    };
}

auto work_item_from_json(const json& j) -> Result<WorkItem> {
    if (!j.is_object()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Work item must be an object"));
    }
    auto content = j.find("content");
    if (content == j.end() || !content->is_string()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Work item needs a string 'content'"));
    }

    WorkItem item;
    item.content = content->get<std::string>();

    if (auto status = j.find("status"); status != j.end() && !status->is_null()) {
        if (!status->is_string()) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Work item 'status' must be a string"));
        }
        auto parsed = parse_status(status->get<std::string>());
        if (!parsed) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Unknown work item status",
                                              status->get<std::string>()));
        }
        item.status = *parsed;
    }

    if (!string_field(j, "activeForm", item.active_form)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Work item 'activeForm' must be a string"));
    }
    return item;
}

auto work_items_from_json(const json& j) -> Result<std::vector<WorkItem>> {
    if (!j.is_array()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Work items must be an array"));
    }
    std::vector<WorkItem> items;
    items.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
        auto item = work_item_from_json(j[i]);
        if (!item) {
            return std::unexpected(make_error(item.error().code(),
                                              std::string(item.error().message()),
                                              "index " + std::to_string(i)));
        }
        items.push_back(std::move(*item));
    }
    return items;
}

auto state_from_json(const json& j) -> Result<SessionState> {
    if (!j.is_object()) return std::unexpected(corrupted("State root must be a JSON object"));

    SessionState state;

    if (auto it = j.find("mode"); it != j.end()) {
        if (!it->is_string()) return std::unexpected(corrupted("mode must be a string"));
        auto mode = parse_mode(it->get<std::string>());
        if (!mode) {
            return std::unexpected(make_error(ErrorCode::CorruptedState, "Unknown mode",
                                              it->get<std::string>()));
        }
        state.mode = *mode;
    }

    if (auto it = j.find("current_task"); it != j.end()) {
        auto task = parse_task(*it);
        if (!task) return std::unexpected(task.error());
        state.current_task = std::move(*task);
    }

    if (auto it = j.find("todos"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) return std::unexpected(corrupted("todos must be an object"));
        if (auto ok = parse_item_list(*it, "active", state.todos.active); !ok) {
            return std::unexpected(ok.error());
        }
        if (auto ok = parse_item_list(*it, "stashed", state.todos.stashed); !ok) {
            return std::unexpected(ok.error());
        }
    }

    if (auto it = j.find("flags"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) return std::unexpected(corrupted("flags must be an object"));
        for (const auto& [name, value] : it->items()) {
            if (!value.is_boolean()) {
                return std::unexpected(make_error(ErrorCode::CorruptedState,
                                                  "Flag must be a boolean", name));
            }
            state.flags[name] = value.get<bool>();
        }
    }

    if (auto it = j.find("metadata"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) return std::unexpected(corrupted("metadata must be an object"));
        state.metadata = *it;
    }

    return state;
}

} // namespace daicgate::state
