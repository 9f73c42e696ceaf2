#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "daicgate/core/error.hpp"

namespace daicgate::infra {

/// Read access to the version-control system. The policy layer only ever
/// talks to this interface so tests can substitute an in-memory fake.
class GitClient {
public:
    virtual ~GitClient() = default;

    /// Name of the branch checked out in `repo` ("" on a detached HEAD).
    virtual auto current_branch(const std::filesystem::path& repo) -> Result<std::string> = 0;
};

/// Runs the `git` executable as a child process with a hard deadline.
///
/// The child's stdout is read through an asio stream_descriptor while a
/// steady_timer runs; when the timer fires first the child is killed with
/// SIGKILL, reaped, and a Timeout error is returned.
class ProcessGitClient : public GitClient {
public:
    static constexpr std::size_t kMaxOutputBytes = 64 * 1024;

    explicit ProcessGitClient(std::chrono::milliseconds timeout,
                              std::string git_binary = "git");

    auto current_branch(const std::filesystem::path& repo) -> Result<std::string> override;

    /// Runs `git <args>` in `cwd` and returns its stdout. A non-zero exit is
    /// ProcessFailed; exceeding the deadline is Timeout.
    auto run(const std::filesystem::path& cwd, const std::vector<std::string>& args)
        -> Result<std::string>;

    [[nodiscard]] auto timeout() const -> std::chrono::milliseconds { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
    std::string git_binary_;
};

/// Walks up from `start` (its parent when `start` is not an existing
/// directory) to the nearest directory holding a `.git` directory or a
/// submodule `.git` file.
auto find_git_repo(const std::filesystem::path& start) -> std::optional<std::filesystem::path>;

} // namespace daicgate::infra
