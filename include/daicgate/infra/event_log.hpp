#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

namespace daicgate::infra {

using json = nlohmann::json;

/// Append-only JSON Lines log of workflow events (blocks, transitions,
/// scope violations). Best-effort: write failures are logged at debug level
/// and never affect the decision being made.
class EventLog {
public:
    explicit EventLog(std::filesystem::path file, bool enabled = true);

    /// Appends `event` as one line, adding an ISO-8601 `timestamp` when absent.
    void append(json event) const;

    [[nodiscard]] auto enabled() const -> bool { return enabled_; }
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return file_; }

private:
    std::filesystem::path file_;
    bool enabled_;
};

} // namespace daicgate::infra
