#pragma once

#include <filesystem>
#include <functional>
#include <optional>

#include "daicgate/core/error.hpp"
#include "daicgate/state/session_state.hpp"

namespace daicgate::state {

/// File-backed store for the session state document.
///
/// Every write goes to a temporary sibling that is renamed over the target,
/// so a killed process never leaves a partially written file. edit() holds an
/// exclusive flock on a lock file beside the state for the whole
/// read-modify-write, so concurrent hook processes never lose updates.
class StateStore {
public:
    using Mutator = std::function<void(SessionState&)>;

    explicit StateStore(std::filesystem::path state_file);

    /// Reads the state; creates and persists the default state when absent.
    auto load() -> Result<SessionState>;

    /// Atomically replaces the state file.
    auto save(const SessionState& state) -> VoidResult;

    /// Locks, re-reads the current file, applies `fn`, saves and unlocks.
    /// Returns the state as written.
    auto edit(const Mutator& fn) -> Result<SessionState>;

    /// Replaces the state with the defaults.
    auto reset() -> Result<SessionState>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    /// nullopt when the file does not exist.
    auto read_file() const -> Result<std::optional<SessionState>>;

    std::filesystem::path path_;
    std::filesystem::path lock_path_;
};

} // namespace daicgate::state
