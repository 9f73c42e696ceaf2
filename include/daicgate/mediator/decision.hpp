#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "daicgate/core/error.hpp"
#include "daicgate/core/types.hpp"

namespace daicgate::mediator {

using json = nlohmann::json;

enum class Verdict {
    Allow,
    Block,
    Fatal,
};

auto verdict_to_string(Verdict verdict) -> std::string_view;

/// The outcome of one mediation. Blocks always carry a reason and a
/// remediation; allows may carry a diagnostic note for the terminal.
struct Decision {
    Verdict verdict = Verdict::Allow;
    std::string category;     // e.g. "DAIC: Tool Blocked", "Security"
    std::string reason;
    std::string remediation;
    std::string tool;
    Mode mode = Mode::Discussion;
    std::string note;

    static auto allow(std::string note = {}) -> Decision;
    static auto block(std::string category, std::string reason, std::string remediation,
                      std::string tool, Mode mode) -> Decision;
    static auto fatal(const Error& error) -> Decision;

    /// 0 = allow, 1 = fatal, 2 = block.
    [[nodiscard]] auto exit_code() const -> int;

    /// Structured document written to stdout on a block.
    [[nodiscard]] auto to_hook_json() const -> json;

    /// to_hook_json() serialised on one line. Invalid UTF-8 (a branch name,
    /// a path) is replaced with U+FFFD instead of throwing.
    [[nodiscard]] auto hook_document() const -> std::string;

    /// Human-readable copy for stderr: "[category] reason" then the remediation.
    [[nodiscard]] auto diagnostic() const -> std::string;
};

} // namespace daicgate::mediator
