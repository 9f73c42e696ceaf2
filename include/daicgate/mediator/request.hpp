#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "daicgate/core/error.hpp"

namespace daicgate::mediator {

using json = nlohmann::json;

/// A candidate tool invocation as presented by the host (PreToolUse).
struct ToolRequest {
    std::string tool_name;
    json tool_input = json::object();
    std::optional<std::filesystem::path> cwd;

    /// `tool_input.command` when it is a string, "" otherwise.
    [[nodiscard]] auto command() const -> std::string;

    /// The path the tool operates on: `file_path`, else `notebook_path`,
    /// else `path`. Empty strings count as absent.
    [[nodiscard]] auto raw_target() const -> std::optional<std::string>;

    /// raw_target() made absolute against `cwd`, or `project_root` when the
    /// request carries no working directory.
    [[nodiscard]] auto target_path(const std::filesystem::path& project_root) const
        -> std::optional<std::filesystem::path>;
};

/// A user prompt as presented by the host (UserPromptSubmit).
struct PromptRequest {
    std::string prompt;
};

/// The payload must be an object with a string `tool_name`; `tool_input`
/// must be an object when present and `cwd` a string. Anything else is an
/// InvalidArgument error.
auto parse_tool_request(const json& payload) -> Result<ToolRequest>;
auto parse_tool_request(std::string_view text) -> Result<ToolRequest>;

/// The payload must be an object with a string `prompt`.
auto parse_prompt_request(std::string_view text) -> Result<PromptRequest>;

} // namespace daicgate::mediator
