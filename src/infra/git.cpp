#include "daicgate/infra/git.hpp"

#include "daicgate/core/logger.hpp"
#include "daicgate/core/utils.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <functional>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace daicgate::infra {

namespace {

auto reap(pid_t pid) -> int {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return status;
}

} // anonymous namespace

ProcessGitClient::ProcessGitClient(std::chrono::milliseconds timeout, std::string git_binary)
    : timeout_(timeout)
    , git_binary_(std::move(git_binary)) {}

auto ProcessGitClient::current_branch(const std::filesystem::path& repo)
    -> Result<std::string> {
    auto output = run(repo, {"branch", "--show-current"});
    if (!output) return std::unexpected(output.error());
    return utils::trim(*output);
}

auto ProcessGitClient::run(const std::filesystem::path& cwd,
                           const std::vector<std::string>& args) -> Result<std::string> {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(make_error(ErrorCode::ProcessFailed,
            "Failed to create pipe for git", std::strerror(errno)));
    }

    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(git_binary_);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) argv.push_back(arg.data());
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(make_error(ErrorCode::ProcessFailed,
            "Failed to fork git process", std::strerror(err)));
    }

    if (pid == 0) {
        // Child: stdout to the pipe, stdin/stderr to /dev/null
        if (::chdir(cwd.c_str()) != 0) ::_exit(126);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::dup2(fds[1], STDOUT_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(fds[1]);

    boost::asio::io_context ioc;
    boost::asio::posix::stream_descriptor out(ioc, fds[0]);
    boost::asio::steady_timer timer(ioc, timeout_);
    std::array<char, 4096> buf{};
    std::string output;
    bool timed_out = false;

    std::function<void()> read_more = [&] {
        out.async_read_some(boost::asio::buffer(buf),
            [&](const boost::system::error_code& ec, std::size_t n) {
                if (!ec) {
                    if (output.size() < kMaxOutputBytes) output.append(buf.data(), n);
                    read_more();
                    return;
                }
                // EOF, error or cancellation: stop the deadline
                timer.cancel();
            });
    };

    timer.async_wait([&](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        timed_out = true;
        ::kill(pid, SIGKILL);
        boost::system::error_code ignored;
        out.close(ignored);
    });

    read_more();
    ioc.run();

    int status = reap(pid);

    if (timed_out) {
        LOG_DEBUG("git {} timed out after {}ms in {}", utils::join(args, " "),
                  timeout_.count(), cwd.string());
        return std::unexpected(make_error(ErrorCode::Timeout,
            "git did not finish in time",
            std::to_string(timeout_.count()) + "ms"));
    }
    if (status < 0 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = (status >= 0 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
        return std::unexpected(make_error(ErrorCode::ProcessFailed,
            "git " + utils::join(args, " ") + " failed in " + cwd.string(),
            "exit status " + std::to_string(code)));
    }
    return output;
}

auto find_git_repo(const std::filesystem::path& start) -> std::optional<std::filesystem::path> {
    namespace fs = std::filesystem;
    std::error_code ec;

    auto current = fs::absolute(start, ec).lexically_normal();
    if (ec) return std::nullopt;
    if (!fs::is_directory(current, ec)) {
        current = current.parent_path();
    }

    while (!current.empty()) {
        if (fs::exists(current / ".git", ec)) {
            return current;
        }
        auto parent = current.parent_path();
        if (parent == current) break;
        current = parent;
    }
    return std::nullopt;
}

} // namespace daicgate::infra
