#include "daicgate/policy/tool_policy.hpp"

#include "daicgate/core/logger.hpp"
#include "daicgate/infra/paths.hpp"
#include "daicgate/policy/shell_parser.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <iterator>
#include <vector>

namespace daicgate::policy {

namespace {

/// Turns each `{a,b}` brace group into `*` so fnmatch can over-approximate
/// brace expansion.
auto braces_to_star(std::string_view word) -> std::string {
    std::string out;
    int depth = 0;
    for (char c : word) {
        if (c == '{') {
            if (depth++ == 0) out += '*';
        } else if (c == '}' && depth > 0) {
            --depth;
        } else if (depth == 0) {
            out += c;
        }
    }
    return out;
}

/// True when a word of `command` names the sessions directory and carries a
/// glob or brace pattern whose last path component matches a protected file.
auto glob_reaches_protected(std::string_view command,
                            const std::unordered_set<std::string>& names) -> bool {
    static constexpr std::string_view kDelimiters = " \t\n'\"`;&|<>()=";

    std::size_t pos = 0;
    while (pos < command.size()) {
        auto start = command.find_first_not_of(kDelimiters, pos);
        if (start == std::string_view::npos) break;
        auto end = command.find_first_of(kDelimiters, start);
        auto word = command.substr(start, end == std::string_view::npos ? end : end - start);
        pos = end == std::string_view::npos ? command.size() : end;

        if (word.find("sessions") == std::string_view::npos ||
            word.find_first_of("*?[{") == std::string_view::npos) {
            continue;
        }
        auto pattern = braces_to_star(word);
        if (auto slash = pattern.rfind('/'); slash != std::string::npos) {
            pattern.erase(0, slash + 1);
        }
        for (const auto& name : names) {
            if (::fnmatch(pattern.c_str(), name.c_str(), 0) == 0) return true;
        }
    }
    return false;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Static data
// ---------------------------------------------------------------------------

auto ToolPolicy::protected_file_names() -> const std::unordered_set<std::string>& {
    static const std::unordered_set<std::string> names = {
        "sessions-state.json",
        "sessions-config.json",
    };
    return names;
}

ToolPolicy::ToolPolicy(std::filesystem::path project_root, const PolicyConfig& config)
    : project_root_(std::move(project_root))
    , config_(config) {}

// ---------------------------------------------------------------------------
// Protected resources
// ---------------------------------------------------------------------------

auto ToolPolicy::is_protected_path(const std::filesystem::path& target) const -> bool {
    if (infra::same_location(target, infra::state_file_path(project_root_)) ||
        infra::same_location(target, infra::config_file_path(project_root_))) {
        return true;
    }
    // Another checkout's state file is just as off limits
    return protected_file_names().contains(target.filename().string()) &&
           target.parent_path().filename() == "sessions";
}

auto ToolPolicy::mentions_protected_file(std::string_view command) const -> bool {
    for (const auto& name : protected_file_names()) {
        if (command.find(name) != std::string_view::npos) return true;
    }
    return glob_reaches_protected(command, protected_file_names());
}

auto ToolPolicy::invokes_state_command(std::string_view command) const -> bool {
    static const std::unordered_set<std::string> mutating = {"mode", "task", "bypass", "reset"};

    if (command.find("daicgate") == std::string_view::npos) return false;

    auto line = parse_command_line(command);
    if (!line) return true;

    for (const auto& segment : line->segments) {
        std::vector<std::string> words;
        words.push_back(segment.base);
        words.insert(words.end(), segment.args.begin(), segment.args.end());

        auto self = std::find_if(words.begin(), words.end(), [](const std::string& w) {
            return std::filesystem::path(w).filename() == "daicgate";
        });
        if (self == words.end()) {
            // `bash -c "daicgate state …"` and friends: look inside quoted scripts
            for (const auto& word : words) {
                if (word != command && word.find("daicgate") != std::string::npos &&
                    word.find_first_of(" \t\n;&|") != std::string::npos &&
                    invokes_state_command(word)) {
                    return true;
                }
            }
            continue;
        }

        auto state_cmd = std::find(self, words.end(), "state");
        if (state_cmd != words.end() && std::next(state_cmd) != words.end() &&
            mutating.contains(*std::next(state_cmd))) {
            return true;
        }
    }
    for (const auto& sub : line->substitutions) {
        if (invokes_state_command(sub)) return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Work artifacts and blocked tools
// ---------------------------------------------------------------------------

auto ToolPolicy::is_work_artifact(const std::filesystem::path& target) const -> bool {
    auto rel = infra::relative_to_root(target, project_root_);
    if (!rel || rel->empty()) return false;

    auto rel_str = rel->generic_string();
    if (rel_str.starts_with("..")) return false;

    for (auto prefix : config_.blocked_actions.work_artifact_prefixes) {
        if (prefix.empty()) continue;
        if (!prefix.ends_with('/')) prefix += '/';
        if (rel_str.starts_with(prefix)) {
            LOG_DEBUG("{} is a work artifact (prefix {})", rel_str, prefix);
            return true;
        }
    }
    return false;
}

auto ToolPolicy::is_blocked_while_locked(std::string_view tool) const -> bool {
    return config_.blocked_actions.is_tool_blocked(tool);
}

} // namespace daicgate::policy
