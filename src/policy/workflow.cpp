#include "daicgate/policy/workflow.hpp"

#include "daicgate/core/logger.hpp"

#include <array>
#include <optional>

namespace daicgate::policy {

namespace {

using state::SessionState;
using Handler = void (*)(SessionState&, TransitionResult&);

struct Transition {
    WorkflowEvent event;
    std::optional<Mode> from;  // nullopt: any mode
    Handler apply;
};

// ---------------------------------------------------------------------------
// Side effects
// ---------------------------------------------------------------------------

void enter_plan(SessionState& s, TransitionResult& r) {
    const std::string prev_key(kPlanPrevModeKey);
    const std::string count_key(kPlanStashedCountKey);

    if (!s.metadata.contains(prev_key)) {
        s.metadata[prev_key] = std::string(mode_to_string(s.mode));
    }

    bool already_recorded = s.metadata.contains(count_key) &&
                            s.metadata[count_key].is_number_integer() &&
                            s.metadata[count_key].get<long long>() > 0;
    if (!s.todos.active.empty() && !already_recorded) {
        auto stashed = s.todos.stash_active();
        if (stashed > 0) {
            s.metadata[count_key] = stashed;
            r.items_stashed = stashed;
        }
    }

    s.mode = Mode::Plan;
    r.to = Mode::Plan;
    r.changed = true;
}

void stay_in_plan(SessionState&, TransitionResult& r) {
    r.to = Mode::Plan;
}

void exit_plan(SessionState& s, TransitionResult& r) {
    const std::string prev_key(kPlanPrevModeKey);
    const std::string count_key(kPlanStashedCountKey);

    std::string prev_name = "discussion";
    if (auto it = s.metadata.find(prev_key); it != s.metadata.end() && it->is_string()) {
        prev_name = it->get<std::string>();
    }
    long long stashed_count = 0;
    if (auto it = s.metadata.find(count_key); it != s.metadata.end() && it->is_number_integer()) {
        stashed_count = it->get<long long>();
    }
    bool had_context = s.metadata.contains(prev_key) || s.metadata.contains(count_key);
    s.metadata.erase(prev_key);
    s.metadata.erase(count_key);

    if (stashed_count > 0) {
        r.items_restored = s.todos.restore_stashed();
    }

    auto target = parse_mode(prev_name).value_or(Mode::Discussion);
    if (target == Mode::Plan) {
        target = Mode::Discussion;
    }
    // Never resume implementing without an approved list to work from
    if (target == Mode::Implementation && s.todos.active.empty()) {
        target = Mode::Discussion;
    }

    r.changed = had_context || r.items_restored > 0 || target != s.mode;
    s.mode = target;
    r.to = target;
}

void approve_implementation(SessionState& s, TransitionResult& r) {
    s.mode = Mode::Implementation;
    r.to = Mode::Implementation;
    r.changed = true;
}

void return_to_discussion(SessionState& s, TransitionResult& r) {
    r.items_cleared = s.todos.active.size();
    s.todos.clear_active();
    r.changed = s.mode != Mode::Discussion || r.items_cleared > 0;
    s.mode = Mode::Discussion;
    r.to = Mode::Discussion;
}

// ---------------------------------------------------------------------------
// Transition table
// ---------------------------------------------------------------------------

const std::array<Transition, 7>& transitions() {
    static const std::array<Transition, 7> table = {{
        {WorkflowEvent::EnterPlan, Mode::Discussion, enter_plan},
        {WorkflowEvent::EnterPlan, Mode::Implementation, enter_plan},
        {WorkflowEvent::EnterPlan, Mode::Plan, stay_in_plan},
        {WorkflowEvent::ExitPlan, Mode::Plan, exit_plan},
        {WorkflowEvent::ImplementationApproved, Mode::Discussion, approve_implementation},
        {WorkflowEvent::DiscussionRequested, Mode::Implementation, return_to_discussion},
        {WorkflowEvent::ScopeViolation, std::nullopt, return_to_discussion},
    }};
    return table;
}

} // anonymous namespace

auto event_to_string(WorkflowEvent event) -> std::string_view {
    switch (event) {
        case WorkflowEvent::EnterPlan: return "enter_plan";
        case WorkflowEvent::ExitPlan: return "exit_plan";
        case WorkflowEvent::ImplementationApproved: return "implementation_approved";
        case WorkflowEvent::DiscussionRequested: return "discussion_requested";
        case WorkflowEvent::ScopeViolation: return "scope_violation";
    }
    return "unknown";
}

auto apply_event(state::SessionState& state, WorkflowEvent event) -> TransitionResult {
    TransitionResult result;
    result.from = state.mode;
    result.to = state.mode;

    for (const auto& t : transitions()) {
        if (t.event != event) continue;
        if (t.from && *t.from != state.mode) continue;
        t.apply(state, result);
        LOG_DEBUG("Workflow {}: {} -> {} (changed={})", event_to_string(event),
                  mode_to_string(result.from), mode_to_string(result.to), result.changed);
        return result;
    }

    LOG_DEBUG("Workflow {} ignored in {} mode", event_to_string(event),
              mode_to_string(state.mode));
    return result;
}

} // namespace daicgate::policy
