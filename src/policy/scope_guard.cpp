#include "daicgate/policy/scope_guard.hpp"

#include "daicgate/core/logger.hpp"

namespace daicgate::policy {

namespace {

auto descriptions(const std::vector<state::WorkItem>& items) -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(items.size());
    for (const auto& item : items) result.push_back(item.content);
    return result;
}

} // anonymous namespace

auto ScopeGuard::submit(state::SessionState& state, std::vector<state::WorkItem> items)
    -> ScopeOutcome {
    ScopeOutcome outcome;

    if (state.todos.active.empty() ||
        state.todos.contents(state::WorkList::Active) == descriptions(items)) {
        LOG_DEBUG("Work items accepted ({} items)", items.size());
        state.todos.active = std::move(items);
        return outcome;
    }

    LOG_INFO("Work item list changed ({} -> {} items), returning to discussion",
             state.todos.active.size(), items.size());
    outcome.verdict = ScopeVerdict::Rejected;
    outcome.transition = apply_event(state, WorkflowEvent::ScopeViolation);
    outcome.reason =
        "Todo list changed - this violates the agreed execution boundaries. "
        "Previous todos were cleared and the session returned to discussion mode.";
    outcome.remediation =
        "If you need to change the task list, propose the updated version and wait for "
        "approval. If this was an error, re-propose your previously planned todos.";
    return outcome;
}

} // namespace daicgate::policy
