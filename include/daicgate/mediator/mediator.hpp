#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "daicgate/core/config.hpp"
#include "daicgate/infra/event_log.hpp"
#include "daicgate/infra/git.hpp"
#include "daicgate/mediator/decision.hpp"
#include "daicgate/mediator/request.hpp"
#include "daicgate/policy/triggers.hpp"
#include "daicgate/policy/workflow.hpp"
#include "daicgate/state/store.hpp"

namespace daicgate::mediator {

/// Everything one mediation needs. The mediator keeps no state of its own
/// between calls; durability lives in the store.
struct MediatorContext {
    std::filesystem::path project_root;
    state::StateStore& store;
    const PolicyConfig& config;
    infra::GitClient& git;
    const infra::EventLog* events = nullptr;
};

/// Result of handling a user prompt.
struct PromptOutcome {
    std::vector<policy::TriggerMatch> matches;
    std::optional<policy::TransitionResult> transition;
    std::string additional_context;  // empty: nothing to tell the agent
};

/// True when a CI indicator (GITHUB_ACTIONS, GITHUB_WORKFLOW, CI,
/// CONTINUOUS_INTEGRATION) is set to a non-empty value.
auto is_ci_environment() -> bool;

class Mediator {
public:
    explicit Mediator(MediatorContext ctx);

    /// Decides one candidate tool call. Evaluation order:
    ///   1. CI bypass (opt-in)          5. Discussion / Plan gating
    ///   2. protected resources         6. work-item scope guard
    ///   3. bypass flag                 7. branch consistency
    ///   4. plan-mode tools             8. allow
    auto evaluate(const ToolRequest& request) -> Decision;

    /// Applies trigger-phrase transitions for a user prompt.
    auto on_prompt(const PromptRequest& request) -> Result<PromptOutcome>;

private:
    auto handle_plan_tool(const ToolRequest& request, policy::WorkflowEvent event) -> Decision;
    auto evaluate_locked(const ToolRequest& request, const state::SessionState& state,
                         const std::optional<std::filesystem::path>& target) -> Decision;
    auto evaluate_todos(const ToolRequest& request, const state::SessionState& state)
        -> Decision;
    auto evaluate_branch(const ToolRequest& request, const state::SessionState& state,
                         const std::filesystem::path& target) -> Decision;

    /// Records a block in the event log and returns it.
    auto blocked(Decision decision) -> Decision;
    void record(json event) const;

    MediatorContext ctx_;
};

} // namespace daicgate::mediator
