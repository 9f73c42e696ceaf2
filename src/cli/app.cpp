#include "daicgate/cli/app.hpp"
#include "daicgate/core/error.hpp"
#include "daicgate/core/logger.hpp"
#include "daicgate/mediator/decision.hpp"

#include <istream>
#include <ostream>

// Version string; typically injected by CMake via -DDAICGATE_VERSION_STRING=...
#ifndef DAICGATE_VERSION_STRING
#define DAICGATE_VERSION_STRING "0.1.0-dev"
#endif

namespace daicgate::cli {

App::App(std::istream& in, std::ostream& out, std::ostream& err)
    : cli_("daicgate", "DAIC workflow enforcement hook for coding agents")
    , ctx_{in, out, err}
{
    cli_.set_version_flag("--version", DAICGATE_VERSION_STRING,
                          "Display version information");

    // Global option: project root override.
    cli_.add_option("-C,--project-root", project_root_,
                    "Project directory (default: CLAUDE_PROJECT_DIR, then discovery from cwd)")
        ->check(CLI::ExistingDirectory);

    // Global option: log level override.
    cli_.add_option("--log-level", ctx_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->envname("DAICGATE_LOG_LEVEL")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical"}));

    // Require a subcommand.
    cli_.require_subcommand(1);

    // Globals must be applied before any subcommand callback runs.
    cli_.parse_complete_callback([this]() {
        if (!project_root_.empty()) ctx_.project_root = project_root_;
        if (!ctx_.log_level.empty()) Logger::set_level(ctx_.log_level);
    });

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, const char* const* argv) -> int {
    Logger::init("daicgate");

    try {
        cli_.parse(argc, argv);
    } catch (const CLI::Success& e) {
        // --help and --version
        return cli_.exit(e, ctx_.out, ctx_.err);
    } catch (const CLI::ParseError& e) {
        // Usage errors are fatal to the hook, whatever code CLI11 picks
        cli_.exit(e, ctx_.out, ctx_.err);
        Logger::flush();
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Unhandled exception: {}", e.what());
        ctx_.err << mediator::Decision::fatal(
                        make_error(ErrorCode::InternalError, "Unexpected failure", e.what()))
                        .diagnostic()
                 << "\n";
        Logger::flush();
        return 1;
    }

    Logger::flush();
    return ctx_.exit_code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

void App::setup_commands() {
    register_enforce_command(cli_, ctx_);
    register_prompt_command(cli_, ctx_);
    register_classify_command(cli_, ctx_);
    register_state_command(cli_, ctx_);
    register_config_command(cli_, ctx_);
}

} // namespace daicgate::cli
