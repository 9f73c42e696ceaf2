#include "daicgate/mediator/decision.hpp"

namespace daicgate::mediator {

auto verdict_to_string(Verdict verdict) -> std::string_view {
    switch (verdict) {
        case Verdict::Allow: return "allow";
        case Verdict::Block: return "block";
        case Verdict::Fatal: return "fatal";
    }
    return "fatal";
}

auto Decision::allow(std::string note) -> Decision {
    Decision d;
    d.note = std::move(note);
    return d;
}

auto Decision::block(std::string category, std::string reason, std::string remediation,
                     std::string tool, Mode mode) -> Decision {
    Decision d;
    d.verdict = Verdict::Block;
    d.category = std::move(category);
    d.reason = std::move(reason);
    d.remediation = std::move(remediation);
    d.tool = std::move(tool);
    d.mode = mode;
    return d;
}

auto Decision::fatal(const Error& error) -> Decision {
    Decision d;
    d.verdict = Verdict::Fatal;
    d.category = std::string(error_code_to_string(error.code()));
    d.reason = error.what();

    switch (error.code()) {
        case ErrorCode::CorruptedState:
            d.remediation = "Restore sessions/sessions-state.json from a backup, or delete it "
                            "to regenerate the default state.";
            break;
        case ErrorCode::InvalidConfig:
            d.remediation = "Fix sessions/sessions-config.json, restore it from a backup, or "
                            "delete it to fall back to the defaults.";
            break;
        case ErrorCode::InvalidArgument:
            d.remediation = "The hook expects a JSON object on stdin.";
            break;
        default:
            break;
    }
    return d;
}

auto Decision::exit_code() const -> int {
    switch (verdict) {
        case Verdict::Allow: return 0;
        case Verdict::Fatal: return 1;
        case Verdict::Block: return 2;
    }
    return 1;
}

auto Decision::to_hook_json() const -> json {
    return json{
        {"hookEventName", "PreToolUse"},
        {"hookSpecificOutput", {
            {"permissionDecisionReason", reason},
            {"suggestedAction", remediation},
            {"currentMode", std::string(mode_to_string(mode))},
            {"blockedTool", tool},
        }},
    };
}

auto Decision::hook_document() const -> std::string {
    return to_hook_json().dump(-1, ' ', false, json::error_handler_t::replace);
}

auto Decision::diagnostic() const -> std::string {
    std::string text;
    if (verdict == Verdict::Allow) return note;
    text = "[" + category + "] " + reason;
    if (!remediation.empty()) {
        text += "\n" + remediation;
    }
    return text;
}

} // namespace daicgate::mediator
