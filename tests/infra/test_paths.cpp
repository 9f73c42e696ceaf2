#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <string>

#include "daicgate/infra/paths.hpp"

namespace fs = std::filesystem;
using namespace daicgate::infra;

namespace {

// RAII helper: a scratch directory tree removed on destruction.
struct TmpDir {
    fs::path path;
    explicit TmpDir(const char* name)
        : path(fs::temp_directory_path() / name) {
        fs::remove_all(path);
        fs::create_directories(path);
        path = fs::canonical(path);
    }
    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

} // namespace

TEST_CASE("Well-known file locations live under sessions/", "[infra][paths]") {
    fs::path root = "/work/project";
    CHECK(sessions_dir(root) == fs::path("/work/project/sessions"));
    CHECK(state_file_path(root) == fs::path("/work/project/sessions/sessions-state.json"));
    CHECK(config_file_path(root) == fs::path("/work/project/sessions/sessions-config.json"));
    CHECK(events_file_path(root) == fs::path("/work/project/sessions/sessions-events.jsonl"));
}

TEST_CASE("find_project_root walks up to a marker directory", "[infra][paths]") {
    TmpDir tmp("daicgate_test_paths_root");
    fs::create_directories(tmp.path / "sessions");
    fs::create_directories(tmp.path / "src" / "deep" / "nested");

    SECTION("from a nested directory") {
        CHECK(find_project_root(tmp.path / "src" / "deep" / "nested") == tmp.path);
    }

    SECTION("from the root itself") {
        CHECK(find_project_root(tmp.path) == tmp.path);
    }

    SECTION(".claude marks a root as well") {
        fs::create_directories(tmp.path / "src" / ".claude");
        CHECK(find_project_root(tmp.path / "src" / "deep") == tmp.path / "src");
    }
}

TEST_CASE("resolve_project_root prefers the explicit override", "[infra][paths]") {
    TmpDir tmp("daicgate_test_paths_override");
    auto root = resolve_project_root(tmp.path.string());
    CHECK(root == tmp.path);
}

TEST_CASE("resolve_project_root honours CLAUDE_PROJECT_DIR", "[infra][paths]") {
    TmpDir tmp("daicgate_test_paths_env");
    ::setenv("CLAUDE_PROJECT_DIR", tmp.path.c_str(), 1);
    auto root = resolve_project_root(std::nullopt);
    ::unsetenv("CLAUDE_PROJECT_DIR");
    CHECK(root == tmp.path);
}

TEST_CASE("resolve_target_path anchors relative paths", "[infra][paths]") {
    SECTION("relative path joins the base") {
        CHECK(resolve_target_path("src/main.cpp", "/work/project") ==
              fs::path("/work/project/src/main.cpp"));
    }

    SECTION("absolute path is kept") {
        CHECK(resolve_target_path("/etc/hosts", "/work/project") == fs::path("/etc/hosts"));
    }

    SECTION("dot segments are normalised") {
        CHECK(resolve_target_path("docs/../sessions/./x.md", "/work/project") ==
              fs::path("/work/project/sessions/x.md"));
    }
}

TEST_CASE("relative_to_root only accepts paths inside the root", "[infra][paths]") {
    TmpDir tmp("daicgate_test_paths_relative");
    fs::create_directories(tmp.path / "docs");

    SECTION("existing file inside") {
        auto rel = relative_to_root(tmp.path / "docs", tmp.path);
        REQUIRE(rel.has_value());
        CHECK(rel->generic_string() == "docs");
    }

    SECTION("file that does not exist yet") {
        auto rel = relative_to_root(tmp.path / "plans" / "new.md", tmp.path);
        REQUIRE(rel.has_value());
        CHECK(rel->generic_string() == "plans/new.md");
    }

    SECTION("sibling directory with a common name prefix") {
        auto sibling = tmp.path.parent_path() / (tmp.path.filename().string() + "-other");
        CHECK_FALSE(relative_to_root(sibling / "docs" / "a.md", tmp.path).has_value());
    }

    SECTION("escape through ..") {
        CHECK_FALSE(relative_to_root(tmp.path / ".." / "elsewhere", tmp.path).has_value());
    }

    SECTION("symlink pointing outside") {
        auto outside = TmpDir("daicgate_test_paths_outside");
        fs::create_directory_symlink(outside.path, tmp.path / "docs" / "link");
        CHECK_FALSE(relative_to_root(tmp.path / "docs" / "link" / "x.md", tmp.path).has_value());
    }
}

TEST_CASE("same_location compares resolved paths", "[infra][paths]") {
    TmpDir tmp("daicgate_test_paths_same");
    fs::create_directories(tmp.path / "sessions");

    CHECK(same_location(tmp.path / "sessions" / "sessions-state.json",
                        tmp.path / "docs" / ".." / "sessions" / "sessions-state.json"));
    CHECK_FALSE(same_location(tmp.path / "sessions" / "sessions-state.json",
                              tmp.path / "sessions" / "sessions-config.json"));
}

TEST_CASE("ensure_dir creates missing directories", "[infra][paths]") {
    TmpDir tmp("daicgate_test_paths_ensure");
    auto target = tmp.path / "a" / "b" / "c";
    CHECK(ensure_dir(target) == target);
    CHECK(fs::is_directory(target));
}
