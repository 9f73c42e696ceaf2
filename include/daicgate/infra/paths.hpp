#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace daicgate::infra {

/// Finds the project root: the nearest ancestor of `start` (inclusive) that
/// contains a `sessions/` or `.claude/` directory. Falls back to `start`.
auto find_project_root(const std::filesystem::path& start) -> std::filesystem::path;

/// Resolves the project root from, in order: an explicit override, the
/// CLAUDE_PROJECT_DIR environment variable, then find_project_root(cwd).
auto resolve_project_root(const std::optional<std::string>& override_dir)
    -> std::filesystem::path;

/// <root>/sessions
auto sessions_dir(const std::filesystem::path& project_root) -> std::filesystem::path;

/// <root>/sessions/sessions-state.json
auto state_file_path(const std::filesystem::path& project_root) -> std::filesystem::path;

/// <root>/sessions/sessions-config.json
auto config_file_path(const std::filesystem::path& project_root) -> std::filesystem::path;

/// <root>/sessions/sessions-events.jsonl
auto events_file_path(const std::filesystem::path& project_root) -> std::filesystem::path;

/// Resolves a tool-supplied path against `base` and normalises it lexically.
auto resolve_target_path(std::string_view raw, const std::filesystem::path& base)
    -> std::filesystem::path;

/// Path of `path` relative to `root` when it lies inside it; nullopt otherwise.
/// Both sides are resolved through existing symlinked ancestors first.
auto relative_to_root(const std::filesystem::path& path, const std::filesystem::path& root)
    -> std::optional<std::filesystem::path>;

/// True when both paths name the same location after weak canonicalisation.
auto same_location(const std::filesystem::path& a, const std::filesystem::path& b) -> bool;

/// Ensures a directory exists, creating it and parents if necessary.
auto ensure_dir(const std::filesystem::path& path) -> std::filesystem::path;

} // namespace daicgate::infra
