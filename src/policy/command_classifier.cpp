#include "daicgate/policy/command_classifier.hpp"

#include "daicgate/core/logger.hpp"
#include "daicgate/core/utils.hpp"
#include "daicgate/infra/exec_safety.hpp"

#include <algorithm>
#include <unordered_map>

namespace daicgate::policy {

namespace {

/// Lets a rule classify the command it wraps one nesting level deeper.
struct RuleContext {
    const CommandClassifier& classifier;
    int depth;

    [[nodiscard]] auto classify(std::string_view command) const -> CommandRisk {
        return classifier.classify_nested(command, depth + 1);
    }

    [[nodiscard]] auto classify_words(std::vector<std::string> words) const -> CommandRisk {
        if (words.empty()) return CommandRisk::ReadOnly;
        return classifier.classify_command(make_shell_command(std::move(words)), depth + 1);
    }
};

using SubcommandRule = CommandRisk (*)(const ShellCommand&, const RuleContext&);
using ArgumentRule = bool (*)(const ShellCommand&, const RuleContext&);

auto first_arg_lower(const ShellCommand& cmd) -> std::string {
    return cmd.args.empty() ? std::string{} : utils::to_lower(cmd.args.front());
}

auto has_arg(const std::vector<std::string>& args, std::string_view value) -> bool {
    return std::find(args.begin(), args.end(), value) != args.end();
}

// ---------------------------------------------------------------------------
// Subcommand families (decisive)
// ---------------------------------------------------------------------------

auto pip_rule(const ShellCommand& cmd, const RuleContext&) -> CommandRisk {
    static const std::unordered_set<std::string> read_only = {
        "show", "list", "search", "check", "freeze", "help", "--version",
    };
    return read_only.contains(first_arg_lower(cmd)) ? CommandRisk::ReadOnly
                                                    : CommandRisk::WriteLike;
}

auto node_package_rule(const ShellCommand& cmd, const RuleContext&) -> CommandRisk {
    static const std::unordered_set<std::string> read_only = {
        "list", "ls", "view", "show", "search", "help", "info", "outdated", "--version",
    };
    return read_only.contains(first_arg_lower(cmd)) ? CommandRisk::ReadOnly
                                                    : CommandRisk::WriteLike;
}

auto python_rule(const ShellCommand& cmd, const RuleContext& ctx) -> CommandRisk {
    auto flag = first_arg_lower(cmd);
    if (flag == "-c") return CommandRisk::ReadOnly;
    if (flag == "-m") {
        if (cmd.args.size() > 1 && utils::to_lower(cmd.args[1]) == "pip") {
            ShellCommand pip{"pip", std::vector<std::string>(cmd.args.begin() + 2, cmd.args.end())};
            return pip_rule(pip, ctx);
        }
        return CommandRisk::ReadOnly;
    }
    return CommandRisk::WriteLike;
}

/// `git branch` / `git tag` are listings unless a mutating flag or a new name is given.
auto git_listing(const std::vector<std::string>& rest,
                 const std::unordered_set<std::string>& mutating) -> bool {
    bool explicit_list = has_arg(rest, "-l") || has_arg(rest, "--list");
    for (const auto& arg : rest) {
        auto name = arg.substr(0, arg.find('='));
        if (mutating.contains(name)) return false;
        if (!arg.starts_with("-") && !explicit_list) return false;
    }
    return true;
}

auto git_rule(const ShellCommand& cmd, const RuleContext&) -> CommandRisk {
    static const std::unordered_set<std::string> read_only = {
        "status", "log", "diff", "show", "blame", "rev-parse", "describe", "ls-files",
        "ls-tree", "grep", "shortlog", "fetch", "help", "version", "--version",
        "show-ref", "cat-file",
    };
    static const std::unordered_set<std::string> branch_mutating = {
        "-d", "-D", "--delete", "-m", "-M", "--move", "-c", "-C", "--copy", "-f", "--force",
        "-u", "--set-upstream-to", "--unset-upstream", "--edit-description", "-t", "--track",
    };
    static const std::unordered_set<std::string> tag_mutating = {
        "-d", "--delete", "-a", "--annotate", "-s", "--sign", "-u", "--local-user",
        "-f", "--force", "-m", "--message", "-F", "--file",
    };

    // Global options before the subcommand
    std::size_t idx = 0;
    while (idx < cmd.args.size() && cmd.args[idx].starts_with("-")) {
        const auto& opt = cmd.args[idx];
        idx += (opt == "-C" || opt == "-c" || opt == "--git-dir" || opt == "--work-tree" ||
                opt == "--namespace") ? 2 : 1;
    }
    if (idx >= cmd.args.size()) return CommandRisk::ReadOnly;

    auto sub = utils::to_lower(cmd.args[idx]);
    std::vector<std::string> rest(cmd.args.begin() + static_cast<std::ptrdiff_t>(idx) + 1,
                                  cmd.args.end());

    if (read_only.contains(sub)) return CommandRisk::ReadOnly;
    if (sub == "branch") {
        return git_listing(rest, branch_mutating) ? CommandRisk::ReadOnly : CommandRisk::WriteLike;
    }
    if (sub == "tag") {
        return git_listing(rest, tag_mutating) ? CommandRisk::ReadOnly : CommandRisk::WriteLike;
    }
    if (sub == "remote") {
        if (rest.empty() || rest.front() == "-v" || rest.front() == "--verbose" ||
            rest.front() == "show" || rest.front() == "get-url") {
            return CommandRisk::ReadOnly;
        }
        return CommandRisk::WriteLike;
    }
    if (sub == "stash") {
        if (!rest.empty() && (rest.front() == "list" || rest.front() == "show")) {
            return CommandRisk::ReadOnly;
        }
        return CommandRisk::WriteLike;
    }
    if (sub == "config") {
        for (const auto& arg : rest) {
            if (arg == "--get" || arg == "--get-all" || arg == "--get-regexp" ||
                arg == "--list" || arg == "-l") {
                return CommandRisk::ReadOnly;
            }
        }
        return CommandRisk::WriteLike;
    }
    return CommandRisk::WriteLike;
}

auto wrapper_rule(const ShellCommand& cmd, const RuleContext& ctx) -> CommandRisk {
    auto idx = infra::unwrap_command_wrapper_argv(cmd.base, cmd.args);
    if (!idx) return CommandRisk::WriteLike;
    if (*idx >= cmd.args.size()) return CommandRisk::ReadOnly;
    return ctx.classify_words(std::vector<std::string>(
        cmd.args.begin() + static_cast<std::ptrdiff_t>(*idx), cmd.args.end()));
}

auto shell_rule(const ShellCommand& cmd, const RuleContext& ctx) -> CommandRisk {
    auto idx = infra::resolve_inline_command_token_index(cmd.args);
    if (!idx) return CommandRisk::WriteLike;
    return ctx.classify(cmd.args[*idx]);
}

const std::unordered_map<std::string, SubcommandRule>& subcommand_rules() {
    static const std::unordered_map<std::string, SubcommandRule> rules = {
        {"pip", pip_rule},       {"pip3", pip_rule},
        {"npm", node_package_rule}, {"yarn", node_package_rule}, {"pnpm", node_package_rule},
        {"python", python_rule}, {"python3", python_rule},
        {"git", git_rule},
        {"env", wrapper_rule},   {"nice", wrapper_rule},    {"nohup", wrapper_rule},
        {"timeout", wrapper_rule}, {"time", wrapper_rule},  {"stdbuf", wrapper_rule},
        {"ionice", wrapper_rule}, {"command", wrapper_rule}, {"builtin", wrapper_rule},
        {"exec", wrapper_rule},
        {"sh", shell_rule},      {"bash", shell_rule},      {"zsh", shell_rule},
        {"dash", shell_rule},    {"ksh", shell_rule},
    };
    return rules;
}

// ---------------------------------------------------------------------------
// Argument rules (only ever conclude WriteLike)
// ---------------------------------------------------------------------------

auto sed_writes(const ShellCommand& cmd, const RuleContext&) -> bool {
    for (const auto& arg : cmd.args) {
        if (arg.starts_with("--in-place")) return true;
        if (arg.starts_with("--") || !arg.starts_with("-")) continue;
        if (arg.find('i') != std::string::npos) return true;
    }
    return false;
}

/// `>` or `>>` followed by optional blanks and a quoted file name.
auto awk_redirects_to_file(std::string_view script) -> bool {
    for (auto pos = script.find('>'); pos != std::string_view::npos;
         pos = script.find('>', pos + 1)) {
        auto after = pos + 1;
        if (after < script.size() && script[after] == '>') ++after;
        while (after < script.size() && (script[after] == ' ' || script[after] == '\t')) ++after;
        if (after < script.size() && (script[after] == '"' || script[after] == '\'')) return true;
    }
    return false;
}

/// `| "cmd"` pipes output into a command.
auto awk_pipes_to_command(std::string_view script) -> bool {
    for (auto pos = script.find('|'); pos != std::string_view::npos;
         pos = script.find('|', pos + 1)) {
        auto after = pos + 1;
        while (after < script.size() && (script[after] == ' ' || script[after] == '\t')) ++after;
        if (after < script.size() && script[after] == '"') return true;
    }
    return false;
}

auto awk_writes(const ShellCommand& cmd, const RuleContext&) -> bool {
    auto script = utils::join(cmd.args, " ");
    return awk_redirects_to_file(script) || awk_pipes_to_command(script) ||
           script.find("print >") != std::string::npos ||
           script.find("printf >") != std::string::npos ||
           script.find("system(") != std::string::npos;
}

auto find_writes(const ShellCommand& cmd, const RuleContext& ctx) -> bool {
    static const std::unordered_set<std::string> writing_actions = {
        "-delete", "-fprint", "-fprint0", "-fprintf", "-fls",
    };
    const auto& args = cmd.args;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (writing_actions.contains(args[i])) return true;
        if (args[i] == "-exec" || args[i] == "-execdir" || args[i] == "-ok" || args[i] == "-okdir") {
            std::vector<std::string> inner;
            for (++i; i < args.size() && args[i] != ";" && args[i] != "+"; ++i) {
                inner.push_back(args[i]);
            }
            if (ctx.classify_words(std::move(inner)) == CommandRisk::WriteLike) return true;
        }
    }
    return false;
}

auto xargs_writes(const ShellCommand& cmd, const RuleContext& ctx) -> bool {
    static const std::unordered_set<std::string> value_options = {
        "-a", "-E", "-I", "-L", "-n", "-P", "-s", "-d",
        "--arg-file", "--delimiter", "--max-args", "--max-procs", "--max-chars",
        "--max-lines", "--replace", "--eof", "--process-slot-var",
    };
    const auto& args = cmd.args;

    for (std::size_t i = 0; i < args.size(); ++i) {
        if (CommandClassifier::write_commands().contains(utils::to_lower(args[i]))) return true;
        if (args[i] == "sed" && i + 1 < args.size() && args[i + 1].starts_with("-i")) return true;
    }

    std::size_t idx = 0;
    while (idx < args.size() && args[idx].starts_with("-")) {
        if (args[idx] == "--") {
            ++idx;
            break;
        }
        idx += value_options.contains(args[idx]) ? 2 : 1;
    }
    if (idx >= args.size()) return false;  // defaults to echo
    return ctx.classify_words(std::vector<std::string>(
               args.begin() + static_cast<std::ptrdiff_t>(idx), args.end())) ==
           CommandRisk::WriteLike;
}

const std::unordered_map<std::string, ArgumentRule>& argument_rules() {
    static const std::unordered_map<std::string, ArgumentRule> rules = {
        {"sed", sed_writes},  {"gsed", sed_writes},
        {"awk", awk_writes},  {"gawk", awk_writes}, {"mawk", awk_writes},
        {"find", find_writes},
        {"xargs", xargs_writes},
    };
    return rules;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Static data
// ---------------------------------------------------------------------------

auto CommandClassifier::write_commands() -> const std::unordered_set<std::string>& {
    static const std::unordered_set<std::string> commands = {
        // File operations
        "rm", "rmdir", "unlink", "shred", "mv", "rename", "cp", "install", "dd",
        "mkdir", "mkfifo", "mknod", "mktemp", "touch", "truncate",
        // Permissions and links
        "chmod", "chown", "chgrp", "umask", "ln", "link", "symlink",
        "setfacl", "setfattr", "chattr",
        // Users and services
        "useradd", "userdel", "usermod", "groupadd", "groupdel", "passwd", "chpasswd",
        "systemctl", "service",
        // System package managers
        "apt", "apt-get", "dpkg", "snap", "yum", "dnf", "rpm", "gem", "cargo",
        // Build tools
        "make", "cmake", "ninja", "meson",
        // Privilege escalation, scheduling, process control
        "sudo", "doas", "su", "crontab", "at", "batch", "kill", "pkill", "killall", "tee",
    };
    return commands;
}

auto CommandClassifier::default_read_only_commands() -> const std::unordered_set<std::string>& {
    static const std::unordered_set<std::string> commands = {
        // File reading
        "cat", "less", "more", "head", "tail", "wc", "nl", "tac", "rev",
        // Search
        "grep", "egrep", "fgrep", "rg", "ripgrep", "ag", "ack",
        // Text processing
        "sort", "uniq", "cut", "paste", "join", "comm", "column", "tr", "expand",
        "unexpand", "fold", "fmt", "pr", "shuf", "tsort",
        // Comparison and checksums
        "diff", "cmp", "sdiff", "vimdiff",
        "md5sum", "sha1sum", "sha256sum", "sha512sum", "cksum", "sum",
        // Binary inspection
        "od", "hexdump", "xxd", "strings", "file", "readelf", "objdump", "nm",
        // Filesystem inspection
        "ls", "dir", "vdir", "pwd", "which", "type", "whereis", "locate", "find",
        "basename", "dirname", "readlink", "realpath", "stat",
        // User and system info
        "whoami", "id", "groups", "users", "who", "w", "last", "lastlog", "hostname",
        "uname", "arch", "lsb_release", "hostnamectl", "date", "cal", "uptime", "df",
        "du", "free", "vmstat", "iostat",
        // Processes
        "ps", "pgrep", "pidof", "top", "htop", "iotop", "atop", "lsof", "jobs",
        "pstree", "fuser",
        // Network
        "netstat", "ss", "ip", "ifconfig", "route", "arp", "ping", "traceroute",
        "tracepath", "mtr", "nslookup", "dig", "host", "whois",
        // Environment and shell state
        "printenv", "set", "export", "alias", "history", "fc",
        // Output and tests
        "echo", "printf", "yes", "seq", "jot", "test", "[", "[[", "true", "false",
        // Calculation
        "bc", "dc", "expr", "factor", "units",
        // Structured data and modern tools
        "jq", "yq", "xmlstarlet", "xmllint", "xsltproc", "bat", "fd", "fzf", "tree",
        "ncdu", "exa", "lsd", "tldr", "cheat", "ast-grep", "sg", "ast_grep",
        // Guarded by argument rules
        "awk", "gawk", "mawk", "sed", "gsed", "xargs",
    };
    return commands;
}

auto risk_to_string(CommandRisk risk) -> std::string_view {
    return risk == CommandRisk::ReadOnly ? "read-only" : "write-like";
}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

auto CommandClassifier::in_operator_list(const std::vector<std::string>& list,
                                         std::string_view base) const -> bool {
    return std::any_of(list.begin(), list.end(), [&](const std::string& name) {
        return utils::to_lower(name) == base;
    });
}

auto CommandClassifier::classify(std::string_view command) const -> CommandRisk {
    return classify_nested(command, 0);
}

auto CommandClassifier::classify_nested(std::string_view command, int depth) const
    -> CommandRisk {
    auto trimmed = utils::trim(command);
    if (trimmed.empty()) return CommandRisk::ReadOnly;
    if (depth > infra::kMaxUnwrapDepth) {
        LOG_DEBUG("Command nesting exceeds {} levels, treating as write-like",
                  infra::kMaxUnwrapDepth);
        return CommandRisk::WriteLike;
    }

    if (has_output_redirection(trimmed)) return CommandRisk::WriteLike;

    auto parsed = parse_command_line(trimmed);
    if (!parsed) {
        LOG_DEBUG("Tokenization failed ({}), extrasafe={}", parsed.error().what(),
                  policy_.extrasafe);
        return policy_.extrasafe ? CommandRisk::WriteLike : CommandRisk::ReadOnly;
    }

    for (const auto& sub : parsed->substitutions) {
        if (classify_nested(sub, depth + 1) == CommandRisk::WriteLike) {
            return CommandRisk::WriteLike;
        }
    }
    for (const auto& segment : parsed->segments) {
        if (classify_command(segment, depth) == CommandRisk::WriteLike) {
            return CommandRisk::WriteLike;
        }
    }
    return CommandRisk::ReadOnly;
}

auto CommandClassifier::classify_command(const ShellCommand& cmd, int depth) const
    -> CommandRisk {
    if (cmd.base.empty()) return CommandRisk::ReadOnly;
    if (depth > infra::kMaxUnwrapDepth) return CommandRisk::WriteLike;

    // 1. Navigation
    if (cmd.base == "cd") return CommandRisk::ReadOnly;

    // 2. Always mutating
    if (write_commands().contains(cmd.base)) return CommandRisk::WriteLike;
    if (in_operator_list(policy_.bash_write_patterns, cmd.base)) return CommandRisk::WriteLike;

    RuleContext ctx{*this, depth};

    // 3. Subcommand families decide on their own
    const auto& subcommands = subcommand_rules();
    if (auto it = subcommands.find(cmd.base); it != subcommands.end()) {
        return it->second(cmd, ctx);
    }

    // 4. Argument-dependent risk
    const auto& arguments = argument_rules();
    if (auto it = arguments.find(cmd.base); it != arguments.end()) {
        if (it->second(cmd, ctx)) return CommandRisk::WriteLike;
    }

    // 5. Known read-only names
    if (in_operator_list(policy_.bash_read_patterns, cmd.base)) return CommandRisk::ReadOnly;
    if (default_read_only_commands().contains(cmd.base)) return CommandRisk::ReadOnly;

    // 6. Unknown
    return policy_.extrasafe ? CommandRisk::WriteLike : CommandRisk::ReadOnly;
}

auto CommandClassifier::is_plain_read(std::string_view command) const -> bool {
    // Read-only names that still execute programs or write through their own syntax
    static const std::unordered_set<std::string> scripted = {
        "awk", "gawk", "mawk", "sed", "gsed", "xargs",
    };
    static const std::vector<std::string_view> find_actions = {
        "-exec", "-execdir", "-ok", "-okdir", "-delete", "-fprint", "-fprint0", "-fprintf", "-fls",
    };

    auto trimmed = utils::trim(command);
    if (has_output_redirection(trimmed)) return false;

    auto parsed = parse_command_line(trimmed);
    if (!parsed || !parsed->substitutions.empty()) return false;

    return std::all_of(parsed->segments.begin(), parsed->segments.end(),
                       [&](const ShellCommand& cmd) {
        if (cmd.base.empty() || cmd.base == "cd") return true;
        if (!default_read_only_commands().contains(cmd.base)) return false;
        if (scripted.contains(cmd.base)) return false;
        if (cmd.base == "find") {
            for (const auto& arg : cmd.args) {
                if (std::find(find_actions.begin(), find_actions.end(), arg) != find_actions.end()) {
                    return false;
                }
            }
        }
        return classify_command(cmd) == CommandRisk::ReadOnly;
    });
}

auto classify(std::string_view command, const PolicyConfig& policy) -> CommandRisk {
    return CommandClassifier(policy.blocked_actions).classify(command);
}

} // namespace daicgate::policy
