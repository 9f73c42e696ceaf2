#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "daicgate/core/error.hpp"

namespace daicgate::policy {

/// One simple command of a shell command line.
struct ShellCommand {
    std::string base;               // lower-cased file name of the command word
    std::vector<std::string> args;  // words after the command word, unquoted
};

struct CommandLine {
    std::vector<ShellCommand> segments;
    /// Inner text of every `$(…)`, backtick and `<(…)` substitution, in order
    /// of appearance. Nested substitutions stay inside their parent's text.
    std::vector<std::string> substitutions;
};

/// True when `command` contains a `>` outside single or double quotes and not
/// escaped by a backslash. This covers `>`, `>>`, `N>&M`, `&>`, `>|` and `>(…)`.
auto has_output_redirection(std::string_view command) -> bool;

/// Splits a command line into simple commands on `|`, `||`, `&&`, `|&`, `;`,
/// `&` and newlines, applying POSIX-style quoting and capturing substitutions.
/// Leading `NAME=value` assignments and reserved words are skipped.
///
/// Unterminated quotes, a trailing backslash or an unterminated substitution
/// yield an InvalidArgument error.
auto parse_command_line(std::string_view command) -> Result<CommandLine>;

/// Builds a ShellCommand from already-split words (the first word is the
/// command). Returns an empty base when `words` is empty.
auto make_shell_command(std::vector<std::string> words) -> ShellCommand;

} // namespace daicgate::policy
