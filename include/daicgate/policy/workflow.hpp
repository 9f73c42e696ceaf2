#pragma once

#include <cstddef>
#include <string_view>

#include "daicgate/core/types.hpp"
#include "daicgate/state/session_state.hpp"

namespace daicgate::policy {

enum class WorkflowEvent {
    EnterPlan,               // the enter-planning tool was invoked
    ExitPlan,                // the exit-planning tool was invoked
    ImplementationApproved,  // the user spoke an implementation phrase
    DiscussionRequested,     // the user asked to stop and talk
    ScopeViolation,          // the scope guard rejected a work-item list
};

auto event_to_string(WorkflowEvent event) -> std::string_view;

/// Metadata keys used to carry the pre-Plan context across invocations.
inline constexpr std::string_view kPlanPrevModeKey = "plan_prev_mode";
inline constexpr std::string_view kPlanStashedCountKey = "plan_stashed_count";

struct TransitionResult {
    Mode from = Mode::Discussion;
    Mode to = Mode::Discussion;
    bool changed = false;
    std::size_t items_stashed = 0;
    std::size_t items_restored = 0;
    std::size_t items_cleared = 0;
};

/// Applies `event` to `state` in place according to the transition table.
/// Events with no entry for the current mode leave the state untouched and
/// report changed=false.
auto apply_event(state::SessionState& state, WorkflowEvent event) -> TransitionResult;

} // namespace daicgate::policy
