#include "verex/verifier.hpp"

#include "verex/format.hpp"
#include "verex/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

using namespace verex::literals;
namespace fs = std::filesystem;

namespace verex {

    namespace detail {

        using clock = std::chrono::steady_clock;

        static constexpr auto reap_interval = std::chrono::milliseconds{5};

        struct pipe_pair {
            int read_fd{-1};
            int write_fd{-1};

            pipe_pair() {
                int fds[2]{};
                if (::pipe2(fds, O_CLOEXEC) != 0) {
                    throw std::runtime_error("pipe() failed: {}"_format(std::strerror(errno)));
                }
                read_fd = fds[0];
                write_fd = fds[1];
            }

            pipe_pair(const pipe_pair&) = delete;
            pipe_pair& operator=(const pipe_pair&) = delete;

            ~pipe_pair() {
                close_read();
                close_write();
            }

            void close_read() {
                if (read_fd >= 0) {
                    ::close(read_fd);
                    read_fd = -1;
                }
            }

            void close_write() {
                if (write_fd >= 0) {
                    ::close(write_fd);
                    write_fd = -1;
                }
            }
        };

        static bool is_executable_file(const fs::path& path) {
            std::error_code ec{};
            return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
        }

        static int decode_wait_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

        static void kill_process_group(pid_t pid) {
            // the child leads its own group; SIGKILL the group so grandchildren go too
            if (::kill(-pid, SIGKILL) != 0) {
                ::kill(pid, SIGKILL);
            }
        }

        static int reap_blocking(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    throw std::runtime_error("waitpid failed: {}"_format(std::strerror(errno)));
                }
            }
            return status;
        }

        // Polls both pipes until they hit EOF or the deadline passes. Returns false on timeout.
        static bool drain_until(pipe_pair& out, pipe_pair& err, std::string& out_buf, std::string& err_buf,
                                clock::time_point deadline) {
            pollfd fds[2]{};
            fds[0] = {.fd = out.read_fd, .events = POLLIN, .revents = 0};
            fds[1] = {.fd = err.read_fd, .events = POLLIN, .revents = 0};
            int fds_open = 2;

            while (fds_open > 0) {
                auto remaining =
                        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
                if (remaining <= 0) {
                    return false;
                }

                int ret = ::poll(fds, 2, static_cast<int>(remaining));
                if (ret < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    throw std::runtime_error("poll failed: {}"_format(std::strerror(errno)));
                }
                if (ret == 0) {
                    return false;
                }

                char chunk[4096]{};
                for (int i = 0; i < 2; ++i) {
                    if (fds[i].fd < 0) {
                        continue;
                    }
                    if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                        auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                        if (n > 0) {
                            (i == 0 ? out_buf : err_buf).append(chunk, static_cast<size_t>(n));
                        }
                        else if (n < 0 && errno == EINTR) {
                            continue;
                        }
                        else {
                            fds[i].fd = -1;
                            --fds_open;
                        }
                    }
                }
            }
            return true;
        }

        // Both pipes are closed but the child may still be running; keep honoring the deadline.
        static std::optional<int> wait_until(pid_t pid, clock::time_point deadline) {
            for (;;) {
                int status = 0;
                auto rc = ::waitpid(pid, &status, WNOHANG);
                if (rc == pid) {
                    return status;
                }
                if (rc < 0 && errno != EINTR) {
                    throw std::runtime_error("waitpid failed: {}"_format(std::strerror(errno)));
                }
                if (clock::now() >= deadline) {
                    return std::nullopt;
                }
                std::this_thread::sleep_for(reap_interval);
            }
        }

    }  // namespace detail

    process_group_guard::~process_group_guard() {
        if (pid_ <= 0) {
            return;
        }
        detail::kill_process_group(pid_);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }

    void process_group_guard::terminate() {
        if (pid_ <= 0) {
            return;
        }
        detail::kill_process_group(pid_);
        auto pid = std::exchange(pid_, -1);
        static_cast<void>(detail::reap_blocking(pid));
    }

    fs::path find_executable(const fs::path& name) {
        if (name.empty()) {
            return {};
        }

        if (name.string().find('/') != std::string::npos) {
            return detail::is_executable_file(name) ? name : fs::path{};
        }

        const char* path_env = std::getenv("PATH");
        std::string_view search{path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin"};

        for (;;) {
            auto sep = search.find(':');
            auto dir = search.substr(0, sep);
            auto candidate = (dir.empty() ? fs::path{"."} : fs::path{dir}) / name;
            if (detail::is_executable_file(candidate)) {
                return candidate;
            }
            if (sep == std::string_view::npos) {
                break;
            }
            search.remove_prefix(sep + 1U);
        }
        return {};
    }

    process_verifier::process_verifier(const fs::path& executable) : executable_{find_executable(executable)} {
        if (executable_.empty()) {
            throw std::runtime_error("verifier executable not found: {}"_format(executable.string()));
        }
    }

    std::vector<std::string> process_verifier::command_for(const fs::path& entry_file) const {
        return {executable_.string(),
                std::string{verifier_args::verify},
                std::string{verifier_args::crate_type_lib},
                entry_file.string()};
    }

    verify_result process_verifier::verify(const fs::path& entry_file, std::chrono::milliseconds timeout) {
        auto args = command_for(entry_file);

        // argv is built before fork; the child only calls async-signal-safe functions
        std::vector<char*> argv{};
        argv.reserve(args.size() + 1U);
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        detail::pipe_pair out{};
        detail::pipe_pair err{};

        auto deadline = detail::clock::now() + timeout;
        auto pid = ::fork();
        if (pid < 0) {
            throw std::runtime_error("fork failed: {}"_format(std::strerror(errno)));
        }

        if (pid == 0) {
            ::setpgid(0, 0);
            if (::dup2(out.write_fd, STDOUT_FILENO) < 0 || ::dup2(err.write_fd, STDERR_FILENO) < 0) {
                _exit(127);
            }
            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }
            ::execv(argv[0], argv.data());
            _exit(127);
        }

        // parent; also set the group here so a kill right after fork cannot miss it
        ::setpgid(pid, pid);
        process_group_guard child{pid};
        out.close_write();
        err.close_write();

        std::string out_buf{};
        std::string err_buf{};
        std::optional<int> status{};

        if (detail::drain_until(out, err, out_buf, err_buf, deadline)) {
            status = detail::wait_until(pid, deadline);
        }
        if (!status) {
            child.terminate();
            debug_log("verifier timed out after ", timeout.count(), "ms: ", entry_file.string());
            return verifier_timed_out{};
        }

        child.release();
        return verifier_completed{
                .exit_code = detail::decode_wait_status(*status),
                .stdout_output = utils::drop_invalid_utf8(out_buf),
                .stderr_output = utils::drop_invalid_utf8(err_buf)};
    }

}  // namespace verex
