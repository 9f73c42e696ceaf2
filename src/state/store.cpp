#include "daicgate/state/store.hpp"

#include "daicgate/core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace daicgate::state {

namespace {

/// Exclusive advisory lock held for the lifetime of the object.
class FileLock {
public:
    static auto acquire(const std::filesystem::path& path) -> Result<FileLock> {
        int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            return std::unexpected(make_error(ErrorCode::IoError,
                "Cannot open state lock file " + path.string(), std::strerror(errno)));
        }
        while (::flock(fd, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            auto err = errno;
            ::close(fd);
            return std::unexpected(make_error(ErrorCode::IoError,
                "Cannot lock " + path.string(), std::strerror(err)));
        }
        return FileLock(fd);
    }

    FileLock(FileLock&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock& operator=(FileLock&&) = delete;

    ~FileLock() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

private:
    explicit FileLock(int fd) : fd_(fd) {}
    int fd_;
};

auto ensure_parent(const std::filesystem::path& file) -> VoidResult {
    std::error_code ec;
    std::filesystem::create_directories(file.parent_path(), ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot create directory " + file.parent_path().string(), ec.message()));
    }
    return {};
}

} // anonymous namespace

StateStore::StateStore(std::filesystem::path state_file)
    : path_(std::move(state_file))
    , lock_path_(path_.parent_path() / ".sessions-state.lock") {}

auto StateStore::read_file() const -> Result<std::optional<SessionState>> {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::optional<SessionState>{};
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot open state file", path_.string()));
    }

    try {
        json j = json::parse(in);
        auto state = state_from_json(j);
        if (!state) {
            return std::unexpected(make_error(ErrorCode::CorruptedState,
                std::string(state.error().message()) + " in " + path_.string(),
                std::string(state.error().detail())));
        }
        return std::optional<SessionState>(std::move(*state));
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::CorruptedState,
            "State file is not valid JSON: " + path_.string(), e.what()));
    }
}

auto StateStore::load() -> Result<SessionState> {
    auto existing = read_file();
    if (!existing) return std::unexpected(existing.error());
    if (*existing) return std::move(**existing);

    // First invocation in this project: create under the lock so two
    // processes do not both write the default.
    return edit([](SessionState&) {});
}

auto StateStore::save(const SessionState& state) -> VoidResult {
    if (auto ok = ensure_parent(path_); !ok) return ok;

    auto tmp_path = std::filesystem::path(
        path_.string() + ".tmp." + std::to_string(::getpid()));

    try {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(make_error(ErrorCode::IoError,
                "Failed to open temp file for writing", tmp_path.string()));
        }
        out << state_to_json(state).dump(2, ' ', false, json::error_handler_t::replace) << '\n';
        out.flush();
        if (!out.good()) {
            throw std::runtime_error("write failed");
        }
        out.close();

        // Atomic rename
        std::filesystem::rename(tmp_path, path_);
        LOG_DEBUG("Saved state to {} (mode={})", path_.string(), mode_to_string(state.mode));
        return {};
    } catch (const std::exception& e) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to write state file " + path_.string(), e.what()));
    }
}

auto StateStore::edit(const Mutator& fn) -> Result<SessionState> {
    if (auto ok = ensure_parent(path_); !ok) return std::unexpected(ok.error());

    auto lock = FileLock::acquire(lock_path_);
    if (!lock) return std::unexpected(lock.error());

    auto current = read_file();
    if (!current) return std::unexpected(current.error());

    SessionState state = current->value_or(SessionState{});
    fn(state);

    if (auto ok = save(state); !ok) return std::unexpected(ok.error());
    return state;
}

auto StateStore::reset() -> Result<SessionState> {
    if (auto ok = ensure_parent(path_); !ok) return std::unexpected(ok.error());

    auto lock = FileLock::acquire(lock_path_);
    if (!lock) return std::unexpected(lock.error());

    SessionState state;
    if (auto ok = save(state); !ok) return std::unexpected(ok.error());
    LOG_INFO("State reset to defaults at {}", path_.string());
    return state;
}

} // namespace daicgate::state
