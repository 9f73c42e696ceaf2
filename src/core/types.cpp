#include "daicgate/core/types.hpp"

namespace daicgate {

auto mode_to_string(Mode mode) -> std::string_view {
    switch (mode) {
        case Mode::Discussion: return "discussion";
        case Mode::Plan: return "plan";
        case Mode::Implementation: return "implementation";
    }
    return "discussion";
}

auto parse_mode(std::string_view name) -> std::optional<Mode> {
    if (name == "discussion") return Mode::Discussion;
    if (name == "plan") return Mode::Plan;
    if (name == "implementation") return Mode::Implementation;
    return std::nullopt;
}

auto mode_display_name(Mode mode) -> std::string_view {
    switch (mode) {
        case Mode::Discussion: return "Discussion";
        case Mode::Plan: return "Plan";
        case Mode::Implementation: return "Implementation";
    }
    return "Discussion";
}

} // namespace daicgate
