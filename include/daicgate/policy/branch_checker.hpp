#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "daicgate/infra/git.hpp"
#include "daicgate/state/session_state.hpp"

namespace daicgate::policy {

enum class BranchStatus {
    NotChecked,            // no active task or no repository owns the path
    Consistent,            // in task, on the task branch
    WrongBranch,           // in task, other branch
    NotInTask,             // task branch, repository not declared
    NotInTaskWrongBranch,  // both problems
    Unverified,            // the branch could not be read; allowed
};

struct BranchCheck {
    BranchStatus status = BranchStatus::NotChecked;
    std::string category;     // message tag, e.g. "Branch Mismatch"
    std::string reason;
    std::string remediation;
    std::optional<std::filesystem::path> repo;
    std::string current_branch;

    [[nodiscard]] auto blocks() const -> bool {
        return status == BranchStatus::WrongBranch || status == BranchStatus::NotInTask ||
               status == BranchStatus::NotInTaskWrongBranch;
    }
};

auto branch_status_to_string(BranchStatus status) -> std::string_view;

/// Verifies that a file about to be modified lives in a repository that is
/// part of the active task and checked out on the task's branch.
class BranchChecker {
public:
    BranchChecker(std::filesystem::path project_root, infra::GitClient& git);

    /// Fails open: when the branch cannot be read the result is Unverified
    /// and a warning is logged.
    [[nodiscard]] auto check(const std::filesystem::path& target,
                             const state::CurrentTask& task) const -> BranchCheck;

private:
    [[nodiscard]] auto display_path(const std::filesystem::path& repo) const -> std::string;

    std::filesystem::path project_root_;
    infra::GitClient& git_;
};

} // namespace daicgate::policy
