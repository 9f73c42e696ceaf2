#include "daicgate/policy/triggers.hpp"

#include "daicgate/core/utils.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace daicgate::policy {

auto category_to_string(TriggerCategory category) -> std::string_view {
    switch (category) {
        case TriggerCategory::ImplementationMode: return "implementation_mode";
        case TriggerCategory::DiscussionMode: return "discussion_mode";
        case TriggerCategory::TaskCreation: return "task_creation";
        case TriggerCategory::TaskStartup: return "task_startup";
        case TriggerCategory::TaskCompletion: return "task_completion";
        case TriggerCategory::ContextCompaction: return "context_compaction";
    }
    return "unknown";
}

auto detect_triggers(std::string_view prompt, const TriggerPhrases& phrases)
    -> std::vector<TriggerMatch> {
    const std::array<std::pair<TriggerCategory, const std::vector<std::string>*>, 6> categories = {{
        {TriggerCategory::ImplementationMode, &phrases.implementation_mode},
        {TriggerCategory::DiscussionMode, &phrases.discussion_mode},
        {TriggerCategory::TaskCreation, &phrases.task_creation},
        {TriggerCategory::TaskStartup, &phrases.task_startup},
        {TriggerCategory::TaskCompletion, &phrases.task_completion},
        {TriggerCategory::ContextCompaction, &phrases.context_compaction},
    }};

    std::vector<TriggerMatch> matches;
    for (const auto& [category, list] : categories) {
        auto it = std::find_if(list->begin(), list->end(), [&](const std::string& phrase) {
            return utils::contains_icase(prompt, phrase);
        });
        if (it != list->end()) {
            matches.push_back({category, *it});
        }
    }
    return matches;
}

auto mode_event_for(const std::vector<TriggerMatch>& matches, Mode mode)
    -> std::optional<WorkflowEvent> {
    auto has = [&](TriggerCategory category) {
        return std::any_of(matches.begin(), matches.end(),
                           [&](const TriggerMatch& m) { return m.category == category; });
    };

    if (mode == Mode::Discussion && has(TriggerCategory::ImplementationMode)) {
        return WorkflowEvent::ImplementationApproved;
    }
    if (mode == Mode::Implementation && has(TriggerCategory::DiscussionMode)) {
        return WorkflowEvent::DiscussionRequested;
    }
    return std::nullopt;
}

} // namespace daicgate::policy
