#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "daicgate/core/config.hpp"
#include "daicgate/policy/shell_parser.hpp"

namespace daicgate::policy {

enum class CommandRisk {
    ReadOnly,
    WriteLike,
};

/// "read-only" / "write-like".
auto risk_to_string(CommandRisk risk) -> std::string_view;

/// Decides whether a shell command line can mutate the filesystem or system
/// state. Fails closed: ambiguity resolves to WriteLike under `extrasafe`.
///
/// A segment is checked in this order: `cd`, the fixed write set, operator
/// write patterns, the subcommand rule table (pip, npm, python, git, wrappers,
/// shells), argument rules (sed, awk, find, xargs), operator read patterns,
/// the default read-only set, and finally the extrasafe fall-through. A line
/// is ReadOnly only when every segment and every substitution is.
class CommandClassifier {
public:
    explicit CommandClassifier(const BlockedActions& policy) : policy_(policy) {}

    [[nodiscard]] auto classify(std::string_view command) const -> CommandRisk;

    /// Classifies a command line found inside another one (`bash -c`,
    /// `find -exec`, substitutions). Beyond the nesting cap the result is WriteLike.
    [[nodiscard]] auto classify_nested(std::string_view command, int depth) const -> CommandRisk;

    /// Classifies one already-tokenized simple command.
    [[nodiscard]] auto classify_command(const ShellCommand& cmd, int depth = 0) const
        -> CommandRisk;

    /// Stricter check for commands that touch protected files: true only when
    /// there is no redirection or substitution and every segment is a
    /// built-in read-only command that cannot run a program or script of its
    /// own. Interpreters, operator read patterns, `sed`, `awk`, `xargs` and
    /// `find -exec` never qualify.
    [[nodiscard]] auto is_plain_read(std::string_view command) const -> bool;

    /// Commands that always mutate, whatever their arguments.
    [[nodiscard]] static auto write_commands() -> const std::unordered_set<std::string>&;

    /// Commands known to be read-only unless an argument rule says otherwise.
    [[nodiscard]] static auto default_read_only_commands()
        -> const std::unordered_set<std::string>&;

private:
    [[nodiscard]] auto in_operator_list(const std::vector<std::string>& list,
                                        std::string_view base) const -> bool;

    const BlockedActions& policy_;
};

/// Convenience wrapper over CommandClassifier.
auto classify(std::string_view command, const PolicyConfig& policy) -> CommandRisk;

} // namespace daicgate::policy
