#pragma once

#include <string>
#include <vector>

#include "daicgate/policy/workflow.hpp"
#include "daicgate/state/session_state.hpp"

namespace daicgate::policy {

enum class ScopeVerdict {
    Accepted,
    Rejected,
};

struct ScopeOutcome {
    ScopeVerdict verdict = ScopeVerdict::Accepted;
    std::string reason;
    std::string remediation;
    TransitionResult transition;  // set on rejection

    [[nodiscard]] auto accepted() const -> bool { return verdict == ScopeVerdict::Accepted; }
};

/// Guards the approved work-item list against silent scope changes.
///
/// The first list submitted is accepted and stored. Later submissions must
/// carry exactly the same descriptions in the same order; statuses may change.
/// Any other list clears the active items, forces the workflow back to
/// Discussion and is rejected.
class ScopeGuard {
public:
    static auto submit(state::SessionState& state, std::vector<state::WorkItem> items)
        -> ScopeOutcome;
};

} // namespace daicgate::policy
