#include "daicgate/mediator/request.hpp"

#include "daicgate/infra/paths.hpp"

#include <array>

namespace daicgate::mediator {

namespace {

auto malformed(std::string message, std::string detail = {}) -> Error {
    return make_error(ErrorCode::InvalidArgument, std::move(message), std::move(detail));
}

auto parse_json_text(std::string_view text) -> Result<json> {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        return std::unexpected(malformed("Request is not valid JSON", e.what()));
    }
}

} // anonymous namespace

auto ToolRequest::command() const -> std::string {
    auto it = tool_input.find("command");
    if (it == tool_input.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

auto ToolRequest::raw_target() const -> std::optional<std::string> {
    static const std::array<const char*, 3> keys = {"file_path", "notebook_path", "path"};
    for (const auto* key : keys) {
        auto it = tool_input.find(key);
        if (it != tool_input.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

auto ToolRequest::target_path(const std::filesystem::path& project_root) const
    -> std::optional<std::filesystem::path> {
    auto raw = raw_target();
    if (!raw) return std::nullopt;
    return infra::resolve_target_path(*raw, cwd.value_or(project_root));
}

auto parse_tool_request(const json& payload) -> Result<ToolRequest> {
    if (!payload.is_object()) {
        return std::unexpected(malformed("Request must be a JSON object"));
    }

    auto name = payload.find("tool_name");
    if (name == payload.end() || !name->is_string() || name->get<std::string>().empty()) {
        return std::unexpected(malformed("Request needs a non-empty string 'tool_name'"));
    }

    ToolRequest request;
    request.tool_name = name->get<std::string>();

    if (auto input = payload.find("tool_input"); input != payload.end() && !input->is_null()) {
        if (!input->is_object()) {
            return std::unexpected(malformed("'tool_input' must be an object",
                                             request.tool_name));
        }
        request.tool_input = *input;
    }

    if (auto cwd = payload.find("cwd"); cwd != payload.end() && !cwd->is_null()) {
        if (!cwd->is_string()) {
            return std::unexpected(malformed("'cwd' must be a string"));
        }
        if (!cwd->get<std::string>().empty()) {
            request.cwd = std::filesystem::path(cwd->get<std::string>());
        }
    }
    return request;
}

auto parse_tool_request(std::string_view text) -> Result<ToolRequest> {
    auto payload = parse_json_text(text);
    if (!payload) return std::unexpected(payload.error());
    return parse_tool_request(*payload);
}

auto parse_prompt_request(std::string_view text) -> Result<PromptRequest> {
    auto payload = parse_json_text(text);
    if (!payload) return std::unexpected(payload.error());
    if (!payload->is_object()) {
        return std::unexpected(malformed("Request must be a JSON object"));
    }
    auto prompt = payload->find("prompt");
    if (prompt == payload->end() || !prompt->is_string()) {
        return std::unexpected(malformed("Request needs a string 'prompt'"));
    }
    return PromptRequest{prompt->get<std::string>()};
}

} // namespace daicgate::mediator
