#include "daicgate/mediator/mediator.hpp"

#include "daicgate/core/logger.hpp"
#include "daicgate/core/utils.hpp"
#include "daicgate/policy/branch_checker.hpp"
#include "daicgate/policy/command_classifier.hpp"
#include "daicgate/policy/scope_guard.hpp"
#include "daicgate/policy/shell_parser.hpp"
#include "daicgate/policy/tool_policy.hpp"

#include <array>
#include <cstdlib>

namespace daicgate::mediator {

namespace {

constexpr std::string_view kToolBlocked = "DAIC: Tool Blocked";
constexpr std::string_view kSecurity = "Security";
constexpr std::string_view kTodoError = "TodoWrite Error";
constexpr std::string_view kScopeBlocked = "DAIC: Blocked";

/// `sessions …` is the project's own state API and is usable in every mode.
auto is_sessions_api_command(std::string_view command) -> bool {
    if (policy::has_output_redirection(command)) return false;
    auto line = policy::parse_command_line(command);
    return line && line->substitutions.empty() && line->segments.size() == 1 &&
           line->segments.front().base == "sessions";
}

auto transition_event(policy::WorkflowEvent event, const policy::TransitionResult& t) -> json {
    return json{
        {"type", "mode_transition"},
        {"event", std::string(policy::event_to_string(event))},
        {"from", std::string(mode_to_string(t.from))},
        {"to", std::string(mode_to_string(t.to))},
        {"items_stashed", t.items_stashed},
        {"items_restored", t.items_restored},
        {"items_cleared", t.items_cleared},
    };
}

auto prompt_context_for(const policy::TriggerMatch& match) -> std::string {
    switch (match.category) {
        case policy::TriggerCategory::TaskCreation:
            return "[Task Creation] The user asked to create a new task ('" + match.phrase + "').";
        case policy::TriggerCategory::TaskStartup:
            return "[Task Startup] The user asked to start a task ('" + match.phrase + "').";
        case policy::TriggerCategory::TaskCompletion:
            return "[Task Completion] The user asked to complete the current task ('" +
                   match.phrase + "').";
        case policy::TriggerCategory::ContextCompaction:
            return "[Context Compaction] The user asked to compact the context ('" +
                   match.phrase + "').";
        case policy::TriggerCategory::ImplementationMode:
        case policy::TriggerCategory::DiscussionMode:
            break;
    }
    return {};
}

} // anonymous namespace

auto is_ci_environment() -> bool {
    static const std::array<const char*, 4> indicators = {
        "GITHUB_ACTIONS", "GITHUB_WORKFLOW", "CI", "CONTINUOUS_INTEGRATION",
    };
    for (const auto* name : indicators) {
        const char* value = std::getenv(name);
        if (value && *value) return true;
    }
    return false;
}

Mediator::Mediator(MediatorContext ctx) : ctx_(std::move(ctx)) {}

void Mediator::record(json event) const {
    if (ctx_.events) ctx_.events->append(std::move(event));
}

auto Mediator::blocked(Decision decision) -> Decision {
    LOG_INFO("Blocked {} in {} mode: [{}] {}", decision.tool, mode_to_string(decision.mode),
             decision.category, decision.reason);
    record({
        {"type", "tool_blocked"},
        {"category", decision.category},
        {"tool", decision.tool},
        {"mode", std::string(mode_to_string(decision.mode))},
    });
    return decision;
}

// ---------------------------------------------------------------------------
// Tool calls
// ---------------------------------------------------------------------------

auto Mediator::evaluate(const ToolRequest& request) -> Decision {
    const auto& config = ctx_.config;

    // 1. Non-interactive environments, when the operator opted in
    if (config.features.ci_bypass && is_ci_environment()) {
        LOG_DEBUG("CI environment detected, enforcement skipped");
        return Decision::allow();
    }

    auto loaded = ctx_.store.load();
    if (!loaded) return Decision::fatal(loaded.error());
    const auto& state = *loaded;

    policy::ToolPolicy tool_policy(ctx_.project_root, config);
    policy::CommandClassifier classifier(config.blocked_actions);
    auto target = request.target_path(ctx_.project_root);
    const bool is_shell = request.tool_name == tools::kBash;

    // 2. Protected resources, regardless of mode or bypass
    if (tools::is_file_mutating(request.tool_name) && target &&
        tool_policy.is_protected_path(*target)) {
        return blocked(Decision::block(std::string(kSecurity),
            "Direct modification of " + target->filename().string() + " is not allowed.",
            "Session state changes go through the todo tool and the daicgate state commands; "
            "configuration is edited by the operator.",
            request.tool_name, state.mode));
    }
    if (is_shell) {
        auto command = request.command();
        // Only plain readers may touch the protected files
        if (tool_policy.mentions_protected_file(command) && !classifier.is_plain_read(command)) {
            return blocked(Decision::block(std::string(kSecurity),
                "Direct modification of the session state or configuration files is not allowed.",
                "Use the todo tool or the daicgate state commands to change session state.",
                request.tool_name, state.mode));
        }
        if (tool_policy.invokes_state_command(command)) {
            return blocked(Decision::block(std::string(kSecurity),
                "The daicgate state commands are reserved for the operator.",
                "Ask the user to change the mode, task or bypass flag from their own terminal.",
                request.tool_name, state.mode));
        }
    }

    // 3. Explicit escape hatch
    if (state.bypass_mode()) {
        LOG_DEBUG("Bypass mode active, allowing {}", request.tool_name);
        return Decision::allow();
    }

    // 4. Plan-mode tools drive the workflow
    if (request.tool_name == tools::kEnterPlanMode) {
        return handle_plan_tool(request, policy::WorkflowEvent::EnterPlan);
    }
    if (request.tool_name == tools::kExitPlanMode) {
        return handle_plan_tool(request, policy::WorkflowEvent::ExitPlan);
    }

    // 5. Locked modes
    if (state.mode == Mode::Discussion || state.mode == Mode::Plan) {
        return evaluate_locked(request, state, target);
    }

    // 6. Approved work list
    if (request.tool_name == tools::kTodoWrite) {
        auto decision = evaluate_todos(request, state);
        if (decision.verdict != Verdict::Allow) return decision;
    }

    // 7. Branch consistency
    if (tools::is_file_mutating(request.tool_name) && target &&
        config.features.branch_enforcement) {
        return evaluate_branch(request, state, *target);
    }

    // 8.
    return Decision::allow();
}

auto Mediator::handle_plan_tool(const ToolRequest& request, policy::WorkflowEvent event)
    -> Decision {
    policy::TransitionResult transition;
    auto edited = ctx_.store.edit([&](state::SessionState& s) {
        transition = policy::apply_event(s, event);
    });
    if (!edited) return Decision::fatal(edited.error());

    if (transition.changed) {
        record(transition_event(event, transition));
    }
    LOG_DEBUG("{} handled: {} -> {}", request.tool_name, mode_to_string(transition.from),
              mode_to_string(transition.to));

    if (event == policy::WorkflowEvent::EnterPlan) {
        return Decision::allow("[Plan Mode] Entered plan mode. Only planning operations are "
                               "allowed until you exit plan mode.");
    }
    if (transition.from != Mode::Plan) {
        return Decision::allow();
    }
    return Decision::allow("[Plan Mode] Exited plan mode. You are back in " +
                           utils::to_lower(mode_display_name(transition.to)) + " mode.");
}

auto Mediator::evaluate_locked(const ToolRequest& request, const state::SessionState& state,
                               const std::optional<std::filesystem::path>& target) -> Decision {
    const auto& config = ctx_.config;
    auto mode_name = std::string(mode_display_name(state.mode));
    auto phrases = config.implementation_phrases();

    if (request.tool_name == tools::kBash) {
        auto command = utils::trim(request.command());
        if (is_sessions_api_command(command)) {
            record({{"type", "tool_allowed"}, {"tool", request.tool_name},
                    {"reason", "sessions_api"}, {"command", command}});
            return Decision::allow();
        }

        policy::CommandClassifier classifier(config.blocked_actions);
        if (classifier.classify(command) == policy::CommandRisk::WriteLike) {
            return blocked(Decision::block(std::string(kToolBlocked),
                "Write-like bash command blocked in " + mode_name +
                    " mode. Only the user can activate implementation mode.",
                "Explain what you want to do and seek alignment first. To proceed, the user "
                "should say: " + phrases +
                    "\n\nNote: commands known to be read-only can be added to "
                    "blocked_actions.bash_read_patterns in sessions/sessions-config.json.",
                request.tool_name, state.mode));
        }

        record({{"type", "tool_allowed"}, {"tool", request.tool_name},
                {"reason", "read_only_command"}, {"command", command}});
        return Decision::allow();
    }

    policy::ToolPolicy tool_policy(ctx_.project_root, config);
    if (target && (tools::is_file_mutating(request.tool_name) ||
                   tool_policy.is_blocked_while_locked(request.tool_name)) &&
        tool_policy.is_work_artifact(*target)) {
        record({{"type", "tool_allowed"}, {"tool", request.tool_name},
                {"reason", "work_artifact_in_planning"}, {"file_path", target->string()}});
        return Decision::allow("[" + mode_name + " Mode] Allowing " + request.tool_name +
                               " for work artifact: " + target->string());
    }

    if (tool_policy.is_blocked_while_locked(request.tool_name)) {
        return blocked(Decision::block(std::string(kToolBlocked),
            "You're in " + mode_name + " mode. The " + request.tool_name +
                " tool is blocked for code changes.",
            "Work artifacts (plans, logs, docs) can be created under " +
                utils::join(config.blocked_actions.work_artifact_prefixes, ", ") +
                ".\n\nFor code changes, seek alignment and get approval by saying: " + phrases,
            request.tool_name, state.mode));
    }

    return Decision::allow();
}

auto Mediator::evaluate_todos(const ToolRequest& request, const state::SessionState& state)
    -> Decision {
    Result<std::vector<state::WorkItem>> items =
        std::unexpected(make_error(ErrorCode::InvalidArgument, "Missing 'todos'"));
    if (auto it = request.tool_input.find("todos"); it != request.tool_input.end()) {
        items = state::work_items_from_json(*it);
    }
    if (!items) {
        return blocked(Decision::block(std::string(kTodoError),
            "Failed to store todos: " + items.error().what(),
            "Submit 'todos' as an array of objects, each with a string 'content' and a "
            "status of pending, in_progress or completed.",
            request.tool_name, state.mode));
    }

    policy::ScopeOutcome outcome;
    auto edited = ctx_.store.edit([&](state::SessionState& s) {
        // Another invocation may have left Implementation since our snapshot
        if (s.mode != Mode::Implementation) return;
        outcome = policy::ScopeGuard::submit(s, std::move(*items));
    });
    if (!edited) return Decision::fatal(edited.error());

    if (outcome.accepted()) {
        return Decision::allow();
    }

    record({
        {"type", "scope_violation"},
        {"from", std::string(mode_to_string(outcome.transition.from))},
        {"items_cleared", outcome.transition.items_cleared},
    });
    return blocked(Decision::block(std::string(kScopeBlocked), outcome.reason,
                                   outcome.remediation, request.tool_name, edited->mode));
}

auto Mediator::evaluate_branch(const ToolRequest& request, const state::SessionState& state,
                               const std::filesystem::path& target) -> Decision {
    policy::BranchChecker checker(ctx_.project_root, ctx_.git);
    auto check = checker.check(target, state.current_task);
    if (!check.blocks()) return Decision::allow();

    record({
        {"type", std::string(policy::branch_status_to_string(check.status))},
        {"service", check.repo ? check.repo->filename().string() : std::string{}},
        {"expected", state.current_task.branch},
        {"actual", check.current_branch},
    });
    return blocked(Decision::block(check.category, check.reason, check.remediation,
                                   request.tool_name, state.mode));
}

// ---------------------------------------------------------------------------
// Prompts
// ---------------------------------------------------------------------------

auto Mediator::on_prompt(const PromptRequest& request) -> Result<PromptOutcome> {
    PromptOutcome outcome;
    outcome.matches = policy::detect_triggers(request.prompt, ctx_.config.trigger_phrases);
    if (outcome.matches.empty()) return outcome;

    auto loaded = ctx_.store.load();
    if (!loaded) return std::unexpected(loaded.error());

    std::vector<std::string> lines;

    if (auto event = policy::mode_event_for(outcome.matches, loaded->mode)) {
        policy::TransitionResult transition;
        auto edited = ctx_.store.edit([&](state::SessionState& s) {
            // Re-derive against the locked state
            if (auto current = policy::mode_event_for(outcome.matches, s.mode)) {
                transition = policy::apply_event(s, *current);
            }
        });
        if (!edited) return std::unexpected(edited.error());

        if (transition.changed) {
            outcome.transition = transition;
            record(transition_event(*event, transition));
            if (transition.to == Mode::Implementation) {
                lines.push_back("[Mode: Implementation] The user approved implementation. "
                                "Record the agreed work items with the todo tool before "
                                "editing; once accepted the list may not change.");
            } else {
                lines.push_back("[Mode: Discussion] The user returned the session to discussion. "
                                "Write tools are blocked until a plan is approved again.");
            }
        }
    } else if (loaded->mode == Mode::Plan) {
        LOG_DEBUG("Trigger phrases ignored in plan mode");
    }

    for (const auto& match : outcome.matches) {
        auto line = prompt_context_for(match);
        if (!line.empty()) lines.push_back(std::move(line));
    }

    outcome.additional_context = utils::join(lines, "\n");
    return outcome;
}

} // namespace daicgate::mediator
