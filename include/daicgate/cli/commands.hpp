#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "daicgate/core/config.hpp"
#include "daicgate/core/error.hpp"

namespace daicgate::cli {

/// State shared by the top-level app and every subcommand callback.
struct CommandContext {
    std::istream& in;
    std::ostream& out;
    std::ostream& err;

    std::optional<std::string> project_root;  // --project-root
    std::string log_level;                    // --log-level / DAICGATE_LOG_LEVEL
    int exit_code = 0;
};

/// A resolved project: its root directory and the policy read from it.
struct Project {
    std::filesystem::path root;
    PolicyConfig config;
};

/// Resolves the project root and loads its policy file, then applies the
/// log level (config < environment < flag).
auto open_project(CommandContext& ctx) -> Result<Project>;

/// Register the `enforce` subcommand.
/// PreToolUse hook: reads one tool request from stdin and exits 0, 1 or 2.
void register_enforce_command(CLI::App& app, CommandContext& ctx);

/// Register the `prompt` subcommand.
/// UserPromptSubmit hook: applies trigger-phrase transitions.
void register_prompt_command(CLI::App& app, CommandContext& ctx);

/// Register the `classify` subcommand.
/// Prints the risk class of a shell command under the current policy.
void register_classify_command(CLI::App& app, CommandContext& ctx);

/// Register the `state` subcommand and its operator actions
/// (show, mode, task, bypass, reset).
void register_state_command(CLI::App& app, CommandContext& ctx);

/// Register the `config` subcommand.
/// Prints the effective policy configuration.
void register_config_command(CLI::App& app, CommandContext& ctx);

} // namespace daicgate::cli
