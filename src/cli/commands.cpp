#include "daicgate/cli/commands.hpp"
#include "daicgate/core/logger.hpp"
#include "daicgate/core/utils.hpp"
#include "daicgate/infra/event_log.hpp"
#include "daicgate/infra/git.hpp"
#include "daicgate/infra/paths.hpp"
#include "daicgate/mediator/decision.hpp"
#include "daicgate/mediator/mediator.hpp"
#include "daicgate/mediator/request.hpp"
#include "daicgate/policy/command_classifier.hpp"
#include "daicgate/policy/workflow.hpp"
#include "daicgate/state/store.hpp"

#include <chrono>
#include <istream>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace daicgate::cli {

using json = nlohmann::json;

namespace {

auto read_all(std::istream& in) -> std::string {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// Prints the error the way the hook reports a fatal decision and exits 1.
void report_error(CommandContext& ctx, const Error& error) {
    LOG_ERROR("{}", error.what());
    ctx.err << mediator::Decision::fatal(error).diagnostic() << "\n";
    ctx.exit_code = 1;
}

/// Writes a decision to the host: the structured document on stdout for a
/// block, the human-readable copy on stderr for anything with text.
void emit_decision(CommandContext& ctx, const mediator::Decision& decision) {
    if (decision.verdict == mediator::Verdict::Block) {
        ctx.out << decision.hook_document() << "\n";
    }
    auto text = decision.diagnostic();
    if (!text.empty()) {
        ctx.err << text << "\n";
    }
    ctx.exit_code = decision.exit_code();
}

auto make_event_log(const Project& project) -> infra::EventLog {
    return infra::EventLog(infra::events_file_path(project.root),
                           project.config.features.event_log);
}

auto make_store(const Project& project) -> state::StateStore {
    return state::StateStore(infra::state_file_path(project.root));
}

void print_task(std::ostream& out, const state::CurrentTask& task) {
    if (!task.is_active()) {
        out << "Task: none\n";
        return;
    }
    out << "Task: " << (task.name.empty() ? "(unnamed)" : task.name) << "\n";
    out << "  branch: " << task.branch << "\n";
    if (!task.file.empty()) out << "  file: " << task.file << "\n";
    if (!task.submodules.empty()) {
        out << "  repos: " << utils::join(task.submodules, ", ") << "\n";
    }
}

} // anonymous namespace

auto open_project(CommandContext& ctx) -> Result<Project> {
    Project project;
    project.root = infra::resolve_project_root(ctx.project_root);

    auto config = load_policy_config(infra::config_file_path(project.root));
    if (!config) return std::unexpected(config.error());
    project.config = std::move(*config);

    Logger::set_level(ctx.log_level.empty() ? project.config.log_level : ctx.log_level);
    LOG_DEBUG("Project root: {}", project.root.string());
    return project;
}

// ---------------------------------------------------------------------------
// enforce command
// ---------------------------------------------------------------------------

void register_enforce_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("enforce",
        "PreToolUse hook: decide one tool call read from stdin (exit 0 allow, 1 fatal, 2 block)");

    sub->callback([&ctx]() {
        auto input = read_all(ctx.in);

        auto project = open_project(ctx);
        if (!project) {
            emit_decision(ctx, mediator::Decision::fatal(project.error()));
            return;
        }

        auto request = mediator::parse_tool_request(input);
        if (!request) {
            emit_decision(ctx, mediator::Decision::fatal(request.error()));
            return;
        }

        auto store = make_store(*project);
        auto events = make_event_log(*project);
        infra::ProcessGitClient git(
            std::chrono::milliseconds(project->config.features.git_timeout_ms));

        mediator::Mediator hook({project->root, store, project->config, git, &events});
        emit_decision(ctx, hook.evaluate(*request));
    });
}

// ---------------------------------------------------------------------------
// prompt command
// ---------------------------------------------------------------------------

void register_prompt_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("prompt",
        "UserPromptSubmit hook: apply trigger phrases from the prompt read from stdin");

    sub->callback([&ctx]() {
        auto input = read_all(ctx.in);

        auto project = open_project(ctx);
        if (!project) {
            report_error(ctx, project.error());
            return;
        }

        auto request = mediator::parse_prompt_request(input);
        if (!request) {
            report_error(ctx, request.error());
            return;
        }

        auto store = make_store(*project);
        auto events = make_event_log(*project);
        infra::ProcessGitClient git(
            std::chrono::milliseconds(project->config.features.git_timeout_ms));

        mediator::Mediator hook({project->root, store, project->config, git, &events});
        auto outcome = hook.on_prompt(*request);
        if (!outcome) {
            report_error(ctx, outcome.error());
            return;
        }

        if (!outcome->additional_context.empty()) {
            json out = {
                {"hookSpecificOutput", {
                    {"hookEventName", "UserPromptSubmit"},
                    {"additionalContext", outcome->additional_context},
                }},
            };
            ctx.out << out.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
        }
        ctx.exit_code = 0;
    });
}

// ---------------------------------------------------------------------------
// classify command
// ---------------------------------------------------------------------------

void register_classify_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("classify",
        "Print whether a shell command is read-only or write-like");

    auto words = std::make_shared<std::vector<std::string>>();
    sub->add_option("command", *words, "Command line to classify (quote it, or put it after --)")
        ->required();

    sub->callback([&ctx, words]() {
        auto project = open_project(ctx);
        if (!project) {
            report_error(ctx, project.error());
            return;
        }

        auto risk = policy::classify(utils::join(*words, " "), project->config);
        ctx.out << policy::risk_to_string(risk) << "\n";
    });
}

// ---------------------------------------------------------------------------
// state command
// ---------------------------------------------------------------------------

namespace {

struct TaskOptions {
    std::string name;
    std::string file;
    std::string branch;
    std::vector<std::string> repos;
    bool clear = false;
};

/// Opens the project and its store, or reports the failure and returns nullopt.
auto open_store(CommandContext& ctx) -> std::optional<std::pair<Project, state::StateStore>> {
    auto project = open_project(ctx);
    if (!project) {
        report_error(ctx, project.error());
        return std::nullopt;
    }
    auto store = make_store(*project);
    return std::make_pair(std::move(*project), std::move(store));
}

void register_state_show(CLI::App& parent, CommandContext& ctx) {
    auto* sub = parent.add_subcommand("show", "Print the session state document");
    sub->callback([&ctx]() {
        auto opened = open_store(ctx);
        if (!opened) return;

        auto loaded = opened->second.load();
        if (!loaded) {
            report_error(ctx, loaded.error());
            return;
        }
        ctx.out << state::state_to_json(*loaded).dump(2, ' ', false,
                                                     json::error_handler_t::replace)
                << "\n";
    });
}

void register_state_mode(CLI::App& parent, CommandContext& ctx) {
    auto* sub = parent.add_subcommand("mode", "Switch between discussion and implementation");

    auto target = std::make_shared<std::string>();
    sub->add_option("mode", *target, "discussion or implementation")
        ->required()
        ->check(CLI::IsMember({"discussion", "implementation"}));

    sub->callback([&ctx, target]() {
        auto opened = open_store(ctx);
        if (!opened) return;
        auto& [project, store] = *opened;

        auto event = *target == "implementation"
            ? policy::WorkflowEvent::ImplementationApproved
            : policy::WorkflowEvent::DiscussionRequested;

        policy::TransitionResult transition;
        auto edited = store.edit([&](state::SessionState& s) {
            transition = policy::apply_event(s, event);
        });
        if (!edited) {
            report_error(ctx, edited.error());
            return;
        }

        if (transition.changed) {
            make_event_log(project).append({
                {"type", "mode_transition"},
                {"event", std::string(policy::event_to_string(event))},
                {"from", std::string(mode_to_string(transition.from))},
                {"to", std::string(mode_to_string(transition.to))},
                {"source", "operator"},
            });
            ctx.out << "Mode: " << mode_to_string(transition.from) << " -> "
                    << mode_to_string(transition.to) << "\n";
        } else {
            ctx.out << "Mode: " << mode_to_string(edited->mode) << " (unchanged)\n";
        }
    });
}

void register_state_task(CLI::App& parent, CommandContext& ctx) {
    auto* sub = parent.add_subcommand("task", "Set or clear the current task");

    auto opts = std::make_shared<TaskOptions>();
    auto* branch = sub->add_option("-b,--branch", opts->branch, "Branch the task works on");
    sub->add_option("-n,--name", opts->name, "Task name");
    sub->add_option("-f,--file", opts->file, "Task file");
    sub->add_option("-r,--repo", opts->repos, "Submodule taking part in the task (repeatable)");
    auto* clear = sub->add_flag("--clear", opts->clear, "Clear the current task");
    clear->excludes(branch);

    sub->callback([&ctx, opts]() {
        if (!opts->clear && opts->branch.empty()) {
            report_error(ctx, make_error(ErrorCode::InvalidArgument,
                                         "state task needs --branch or --clear"));
            return;
        }

        auto opened = open_store(ctx);
        if (!opened) return;
        auto& [project, store] = *opened;

        auto edited = store.edit([&](state::SessionState& s) {
            if (opts->clear) {
                s.current_task = {};
                return;
            }
            s.current_task.name = opts->name;
            s.current_task.file = opts->file;
            s.current_task.branch = opts->branch;
            s.current_task.submodules = opts->repos;
        });
        if (!edited) {
            report_error(ctx, edited.error());
            return;
        }
        print_task(ctx.out, edited->current_task);
    });
}

void register_state_bypass(CLI::App& parent, CommandContext& ctx) {
    auto* sub = parent.add_subcommand("bypass", "Turn enforcement off or back on");

    auto value = std::make_shared<std::string>();
    sub->add_option("value", *value, "on or off")
        ->required()
        ->check(CLI::IsMember({"on", "off"}));

    sub->callback([&ctx, value]() {
        auto opened = open_store(ctx);
        if (!opened) return;
        auto& [project, store] = *opened;

        const bool on = *value == "on";
        auto edited = store.edit([&](state::SessionState& s) {
            s.set_flag(state::kBypassFlag, on);
        });
        if (!edited) {
            report_error(ctx, edited.error());
            return;
        }

        if (on) LOG_WARN("Bypass mode enabled: tool calls are no longer enforced");
        make_event_log(project).append({{"type", "bypass"}, {"enabled", on}});
        ctx.out << "Bypass: " << (on ? "on" : "off") << "\n";
    });
}

void register_state_reset(CLI::App& parent, CommandContext& ctx) {
    auto* sub = parent.add_subcommand("reset", "Replace the session state with the defaults");
    sub->callback([&ctx]() {
        auto opened = open_store(ctx);
        if (!opened) return;
        auto& [project, store] = *opened;

        auto reset = store.reset();
        if (!reset) {
            report_error(ctx, reset.error());
            return;
        }
        make_event_log(project).append({{"type", "state_reset"}});
        ctx.out << "State reset: mode " << mode_to_string(reset->mode) << "\n";
    });
}

} // anonymous namespace

void register_state_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("state", "Inspect or change the session state");
    sub->require_subcommand(1);

    register_state_show(*sub, ctx);
    register_state_mode(*sub, ctx);
    register_state_task(*sub, ctx);
    register_state_bypass(*sub, ctx);
    register_state_reset(*sub, ctx);
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("config", "Show the policy configuration");
    sub->require_subcommand(1);

    auto* show = sub->add_subcommand("show", "Print the effective configuration");
    show->callback([&ctx]() {
        auto project = open_project(ctx);
        if (!project) {
            report_error(ctx, project.error());
            return;
        }
        json j = project->config;
        ctx.out << j.dump(2) << "\n";
    });

    auto* path = sub->add_subcommand("path", "Print the configuration file location");
    path->callback([&ctx]() {
        auto root = infra::resolve_project_root(ctx.project_root);
        ctx.out << infra::config_file_path(root).string() << "\n";
    });
}

} // namespace daicgate::cli
