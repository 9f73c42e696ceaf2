#include "daicgate/infra/paths.hpp"
#include "daicgate/core/logger.hpp"

#include <algorithm>
#include <cstdlib>

namespace daicgate::infra {

namespace fs = std::filesystem;

namespace {

auto weak_canonical(const fs::path& p) -> fs::path {
    std::error_code ec;
    auto resolved = fs::weakly_canonical(p, ec);
    if (ec) return p.lexically_normal();
    return resolved;
}

} // anonymous namespace

auto find_project_root(const fs::path& start) -> fs::path {
    std::error_code ec;
    auto current = fs::absolute(start, ec);
    if (ec) return start;

    while (true) {
        if (fs::is_directory(current / "sessions", ec) ||
            fs::is_directory(current / ".claude", ec)) {
            return current;
        }
        auto parent = current.parent_path();
        if (parent == current || parent.empty()) break;
        current = parent;
    }
    return fs::absolute(start, ec);
}

auto resolve_project_root(const std::optional<std::string>& override_dir) -> fs::path {
    if (override_dir && !override_dir->empty()) {
        return fs::absolute(fs::path(*override_dir)).lexically_normal();
    }
    if (const auto* env = std::getenv("CLAUDE_PROJECT_DIR"); env && *env) {
        return fs::absolute(fs::path(env)).lexically_normal();
    }
    return find_project_root(fs::current_path());
}

auto sessions_dir(const fs::path& project_root) -> fs::path {
    return project_root / "sessions";
}

auto state_file_path(const fs::path& project_root) -> fs::path {
    return sessions_dir(project_root) / "sessions-state.json";
}

auto config_file_path(const fs::path& project_root) -> fs::path {
    return sessions_dir(project_root) / "sessions-config.json";
}

auto events_file_path(const fs::path& project_root) -> fs::path {
    return sessions_dir(project_root) / "sessions-events.jsonl";
}

auto resolve_target_path(std::string_view raw, const fs::path& base) -> fs::path {
    fs::path p{std::string(raw)};
    if (p.is_relative()) {
        p = base / p;
    }
    return p.lexically_normal();
}

auto relative_to_root(const fs::path& path, const fs::path& root) -> std::optional<fs::path> {
    auto canon_path = weak_canonical(path);
    auto canon_root = weak_canonical(root);

    auto [root_end, path_it] = std::mismatch(
        canon_root.begin(), canon_root.end(), canon_path.begin(), canon_path.end());
    // A trailing separator on the root shows up as an empty final element.
    if (root_end != canon_root.end() && !root_end->empty()) {
        return std::nullopt;
    }
    return canon_path.lexically_relative(canon_root);
}

auto same_location(const fs::path& a, const fs::path& b) -> bool {
    return weak_canonical(a) == weak_canonical(b);
}

auto ensure_dir(const fs::path& path) -> fs::path {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        fs::create_directories(path, ec);
        if (ec) {
            LOG_ERROR("Failed to create directory {}: {}", path.string(), ec.message());
        }
    }
    return path;
}

} // namespace daicgate::infra
