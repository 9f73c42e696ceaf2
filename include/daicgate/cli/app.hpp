#pragma once

#include <iosfwd>
#include <string>

#include <CLI/CLI.hpp>

#include "daicgate/cli/commands.hpp"

namespace daicgate::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the hook
/// entry points (enforce, prompt) and the operator commands (classify,
/// state, config). Streams are injected so the whole surface can be driven
/// from tests.
class App {
public:
    App(std::istream& in, std::ostream& out, std::ostream& err);
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code: 0 allow/success, 1 fatal, 2 block.
    auto run(int argc, const char* const* argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    CLI::App cli_;
    CommandContext ctx_;
    std::string project_root_;
};

} // namespace daicgate::cli
