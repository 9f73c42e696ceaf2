#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace daicgate::infra {

/// Maximum nesting of shells and wrappers followed before giving up (fail-closed).
static constexpr int kMaxUnwrapDepth = 8;

/// Wrappers that run their operands as a command in the same process tree.
/// `env nice nohup timeout time stdbuf ionice command builtin exec`.
inline auto is_command_wrapper(std::string_view binary) -> bool {
    return binary == "env" || binary == "nice" || binary == "nohup" ||
           binary == "timeout" || binary == "time" || binary == "stdbuf" ||
           binary == "ionice" || binary == "command" || binary == "builtin" ||
           binary == "exec";
}

/// Shell interpreters that accept an inline script through `-c`.
inline auto is_shell_interpreter(std::string_view binary) -> bool {
    return binary == "sh" || binary == "bash" || binary == "zsh" ||
           binary == "dash" || binary == "ksh";
}

/// Skips a wrapper's own options and operands in `args` (the words after the
/// wrapper name) and returns the index of the wrapped command's name.
///
/// An index equal to `args.size()` means the wrapper was invoked bare (for
/// example `env` printing the environment, or `command -v git`). nullopt
/// means the wrapper was used in a way whose effect cannot be determined
/// statically, e.g. `env -S`, `time -o FILE` or `ionice -p PID`.
auto unwrap_command_wrapper_argv(std::string_view wrapper,
                                 const std::vector<std::string>& args)
    -> std::optional<std::size_t>;

/// For inline shell commands (e.g. `bash -lc "rm -rf x"`), resolves the index
/// in `args` of the script operand. nullopt when the shell would run a script
/// file, read commands from stdin, or start interactively.
auto resolve_inline_command_token_index(const std::vector<std::string>& args)
    -> std::optional<std::size_t>;

} // namespace daicgate::infra
