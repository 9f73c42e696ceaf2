#include "daicgate/policy/branch_checker.hpp"

#include "daicgate/core/logger.hpp"
#include "daicgate/infra/paths.hpp"

#include <algorithm>

namespace daicgate::policy {

auto branch_status_to_string(BranchStatus status) -> std::string_view {
    switch (status) {
        case BranchStatus::NotChecked: return "not_checked";
        case BranchStatus::Consistent: return "consistent";
        case BranchStatus::WrongBranch: return "branch_mismatch";
        case BranchStatus::NotInTask: return "service_not_in_task";
        case BranchStatus::NotInTaskWrongBranch: return "service_not_in_task_and_wrong_branch";
        case BranchStatus::Unverified: return "unverified";
    }
    return "unknown";
}

BranchChecker::BranchChecker(std::filesystem::path project_root, infra::GitClient& git)
    : project_root_(std::move(project_root))
    , git_(git) {}

auto BranchChecker::display_path(const std::filesystem::path& repo) const -> std::string {
    auto rel = infra::relative_to_root(repo, project_root_);
    if (!rel) return repo.string();
    if (rel->empty() || *rel == ".") return ".";
    return rel->string();
}

auto BranchChecker::check(const std::filesystem::path& target,
                          const state::CurrentTask& task) const -> BranchCheck {
    BranchCheck result;
    if (!task.is_active()) return result;

    auto repo = infra::find_git_repo(target);
    if (!repo) {
        LOG_DEBUG("No repository owns {}, branch check skipped", target.string());
        return result;
    }
    result.repo = *repo;

    auto branch = git_.current_branch(*repo);
    if (!branch) {
        LOG_WARN("Could not verify branch for {}: {}", repo->filename().string(),
                 branch.error().what());
        result.status = BranchStatus::Unverified;
        return result;
    }
    result.current_branch = *branch;

    auto name = repo->filename().string();
    bool in_task = infra::same_location(*repo, project_root_) ||
                   std::find(task.submodules.begin(), task.submodules.end(), name) !=
                       task.submodules.end();
    bool branch_correct = *branch == task.branch;

    auto where = display_path(*repo);
    auto task_file = task.file.empty() ? std::string("the task file")
                                       : "the task file (" + task.file + ")";

    if (in_task && branch_correct) {
        result.status = BranchStatus::Consistent;
    } else if (in_task) {
        result.status = BranchStatus::WrongBranch;
        result.category = "Branch Mismatch";
        result.reason = "Repository '" + name + "' is part of this task but is on branch '" +
                        *branch + "' instead of '" + task.branch + "'.";
        result.remediation = "Please run: cd " + where + " && git checkout " + task.branch;
    } else if (branch_correct) {
        result.status = BranchStatus::NotInTask;
        result.category = "Submodule Not in Task";
        result.reason = "Submodule '" + name + "' is on the correct branch '" + task.branch +
                        "' but is not listed in the task file.";
        result.remediation = "Please update " + task_file + " to include '" + name +
                             "' in the submodules list.";
    } else {
        result.status = BranchStatus::NotInTaskWrongBranch;
        result.category = "Submodule Not in Task + Wrong Branch";
        result.reason = "Submodule '" + name + "' has two issues: it is not listed in the "
                        "task file's submodules, and it is on branch '" + *branch +
                        "' instead of '" + task.branch + "'.";
        result.remediation = "To fix: cd " + where + " && git checkout -b " + task.branch +
                             "\nThen update " + task_file + " to include '" + name +
                             "' in the submodules list.";
    }
    return result;
}

} // namespace daicgate::policy
