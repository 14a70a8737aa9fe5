#include "utils.hpp"

extern "C" {
#include <signal.h>
}

#include <cerrno>
#include <stdexcept>
#include <thread>

namespace verex::test {
    using namespace std::string_view_literals;
    using namespace std::chrono_literals;
    using namespace verex::literals;
    namespace fs = std::filesystem;

    namespace {
        bool process_gone(pid_t pid) {
            auto deadline = std::chrono::steady_clock::now() + 3s;
            while (std::chrono::steady_clock::now() < deadline) {
                if (::kill(pid, 0) != 0) {
                    return true;
                }
                // reparented zombies count as gone once they are no longer running
                std::ifstream stat{"/proc/{}/stat"_format(pid)};
                std::string content{};
                std::getline(stat, content);
                if (auto close = content.rfind(')'); close != std::string::npos && close + 2U < content.size()) {
                    if (content[close + 2U] == 'Z') {
                        return true;
                    }
                }
                std::this_thread::sleep_for(20ms);
            }
            return false;
        }

        pid_t spawn_group_leader(const std::string& script) {
            auto pid = ::fork();
            if (pid == 0) {
                ::setpgid(0, 0);
                ::execl("/bin/sh", "sh", "-c", script.c_str(), static_cast<char*>(nullptr));
                _exit(127);
            }
            if (pid > 0) {
                ::setpgid(pid, pid);
            }
            return pid;
        }

        bool wait_for_file(const fs::path& path) {
            auto deadline = std::chrono::steady_clock::now() + 3s;
            while (std::chrono::steady_clock::now() < deadline) {
                if (fs::exists(path) && !detail::slurp(path).empty()) {
                    return true;
                }
                std::this_thread::sleep_for(20ms);
            }
            return false;
        }
    }  // namespace

    TEST_CASE("007: verifier is invoked with the fixed argument contract", "[007][verifier]") {
        detail::temp_dir dir{"verex_007_args"};
        auto stub = detail::write_stub_verifier(dir.path, "verus", R"(printf '%s|' "$@"; exit 0)");

        process_verifier verifier{stub};
        CHECK(verifier.executable() == stub);

        auto entry = dir.path / "crate" / "src" / "lib.rs";
        CHECK(verifier.command_for(entry) ==
              std::vector<std::string>{stub.string(), "--verify", "--crate-type=lib", entry.string()});

        auto result = verifier.verify(entry, 10s);
        REQUIRE(std::holds_alternative<verifier_completed>(result));
        const auto& completed = std::get<verifier_completed>(result);
        CHECK(completed.exit_code == 0);
        CHECK(completed.stdout_output == "--verify|--crate-type=lib|{}|"_format(entry.string()));
        CHECK(completed.stderr_output.empty());
    }

    TEST_CASE("007: non-zero exit is a completed result with captured streams", "[007][verifier]") {
        detail::temp_dir dir{"verex_007_fail"};
        auto stub = detail::write_stub_verifier(dir.path, "verus", R"(echo partial; echo "E0001: bad spec" >&2; exit 1)");

        process_verifier verifier{stub};
        auto result = verifier.verify(dir.path / "lib.rs", 10s);

        REQUIRE(std::holds_alternative<verifier_completed>(result));
        const auto& completed = std::get<verifier_completed>(result);
        CHECK(completed.exit_code == 1);
        CHECK(completed.stdout_output == "partial\n");
        CHECK(completed.stderr_output == "E0001: bad spec\n");
    }

    TEST_CASE("007: signal termination maps to 128 + signo", "[007][verifier]") {
        detail::temp_dir dir{"verex_007_signal"};
        auto stub = detail::write_stub_verifier(dir.path, "verus", "kill -9 $$");

        process_verifier verifier{stub};
        auto result = verifier.verify(dir.path / "lib.rs", 10s);

        REQUIRE(std::holds_alternative<verifier_completed>(result));
        CHECK(std::get<verifier_completed>(result).exit_code == 128 + SIGKILL);
    }

    TEST_CASE("007: large output on both streams does not stall", "[007][verifier]") {
        detail::temp_dir dir{"verex_007_large"};
        auto stub = detail::write_stub_verifier(
                dir.path,
                "verus",
                "head -c 200000 /dev/zero | tr '\\000' 'o'; head -c 150000 /dev/zero | tr '\\000' 'e' >&2; exit 4");

        process_verifier verifier{stub};
        auto result = verifier.verify(dir.path / "lib.rs", 20s);

        REQUIRE(std::holds_alternative<verifier_completed>(result));
        const auto& completed = std::get<verifier_completed>(result);
        CHECK(completed.exit_code == 4);
        CHECK(completed.stdout_output.size() == 200000U);
        CHECK(completed.stderr_output.size() == 150000U);
    }

    TEST_CASE("007: timeout kills the verifier and its children", "[007][verifier]") {
        detail::temp_dir dir{"verex_007_timeout"};
        auto pid_file = dir.path / "child.pid";
        auto stub = detail::write_stub_verifier(
                dir.path, "verus", "sleep 30 &\necho $! > '{}'\nwait"_format(pid_file.string()));

        process_verifier verifier{stub};
        auto start = std::chrono::steady_clock::now();
        auto result = verifier.verify(dir.path / "lib.rs", 300ms);
        auto elapsed = std::chrono::steady_clock::now() - start;

        CHECK(std::holds_alternative<verifier_timed_out>(result));
        CHECK(elapsed < 5s);

        REQUIRE(fs::exists(pid_file));
        auto child_pid = detail::parse_arithmetic<int>(utils::trim_view(detail::read_file(pid_file)));
        REQUIRE(child_pid.has_value());
        CHECK(process_gone(static_cast<pid_t>(*child_pid)));
    }

    TEST_CASE("007: closing the streams early does not escape the deadline", "[007][verifier]") {
        detail::temp_dir dir{"verex_007_closed"};
        auto stub = detail::write_stub_verifier(dir.path, "verus", "exec >/dev/null 2>&1\nexec sleep 30");

        process_verifier verifier{stub};
        auto start = std::chrono::steady_clock::now();
        auto result = verifier.verify(dir.path / "lib.rs", 300ms);

        CHECK(std::holds_alternative<verifier_timed_out>(result));
        CHECK(std::chrono::steady_clock::now() - start < 5s);
    }

    TEST_CASE("007: unwinding past a running verifier kills and reaps its group", "[007][verifier]") {
        detail::temp_dir dir{"verex_007_unwind"};
        auto pid_file = dir.path / "child.pid";

        auto pid = spawn_group_leader("sleep 30 &\necho $! > '{}'\nwait"_format(pid_file.string()));
        REQUIRE(pid > 0);

        auto interrupted_wait = [&] {
            process_group_guard child{pid};
            REQUIRE(wait_for_file(pid_file));
            throw std::runtime_error("poll failed: Bad file descriptor");
        };
        CHECK_THROWS_AS(interrupted_wait(), std::runtime_error);

        int status = 0;
        auto rc = ::waitpid(pid, &status, WNOHANG);
        auto wait_errno = errno;
        CHECK(rc < 0);
        CHECK(wait_errno == ECHILD);

        auto grandchild = detail::parse_arithmetic<int>(utils::trim_view(detail::read_file(pid_file)));
        REQUIRE(grandchild.has_value());
        CHECK(process_gone(static_cast<pid_t>(*grandchild)));
    }

    TEST_CASE("007: a released guard leaves an already reaped child alone", "[007][verifier]") {
        auto pid = spawn_group_leader("exit 3");
        REQUIRE(pid > 0);

        int status = 0;
        REQUIRE(::waitpid(pid, &status, 0) == pid);
        CHECK(WEXITSTATUS(status) == 3);

        process_group_guard child{pid};
        child.release();
        CHECK(child.pid() == -1);
    }

    TEST_CASE("007: missing verifier executable is fatal at construction", "[007][verifier]") {
        detail::temp_dir dir{"verex_007_missing"};

        CHECK_THROWS_AS(process_verifier{dir.path / "verus"}, std::runtime_error);
        CHECK_THROWS_AS(process_verifier{"verex-no-such-verifier-binary"}, std::runtime_error);

        detail::write_file(dir.path / "not_executable", "#!/bin/sh\nexit 0\n");
        CHECK_THROWS_AS(process_verifier{dir.path / "not_executable"}, std::runtime_error);
    }

    TEST_CASE("007: bare names resolve on PATH", "[007][verifier]") {
        auto sh = find_executable("sh");
        REQUIRE_FALSE(sh.empty());
        CHECK(sh.filename() == "sh");
        CHECK(find_executable("").empty());
        CHECK(find_executable("verex-no-such-verifier-binary").empty());
    }
}  // namespace verex::test
