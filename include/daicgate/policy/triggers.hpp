#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "daicgate/core/config.hpp"
#include "daicgate/policy/workflow.hpp"

namespace daicgate::policy {

enum class TriggerCategory {
    ImplementationMode,
    DiscussionMode,
    TaskCreation,
    TaskStartup,
    TaskCompletion,
    ContextCompaction,
};

/// Config key of the category, e.g. "implementation_mode".
auto category_to_string(TriggerCategory category) -> std::string_view;

struct TriggerMatch {
    TriggerCategory category;
    std::string phrase;  // the configured phrase that matched
};

/// Every category with at least one phrase occurring in `prompt`
/// (case-insensitive substring match), in declaration order.
auto detect_triggers(std::string_view prompt, const TriggerPhrases& phrases)
    -> std::vector<TriggerMatch>;

/// The mode change a prompt asks for in `mode`, if any: an implementation
/// phrase in Discussion, a discussion phrase in Implementation. Plan mode
/// ignores phrases.
auto mode_event_for(const std::vector<TriggerMatch>& matches, Mode mode)
    -> std::optional<WorkflowEvent>;

} // namespace daicgate::policy
