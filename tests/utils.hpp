#pragma once

#include "verex.hpp"

#include <catch2/catch_test_macros.hpp>

extern "C" {
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <atomic>
#include <charconv>
#include <concepts>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace verex::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            static std::atomic<unsigned> counter{0U};
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now << "_" << counter++;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        fs::create_directories(p.parent_path());
        std::ofstream out{p, std::ios::binary};
        REQUIRE(out.good());
        out << content;
    }

    inline std::string read_file(const fs::path& p) {
        std::ifstream in{p, std::ios::binary};
        REQUIRE(in.good());
        return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    }

    template <typename T>
        requires std::integral<T>
    std::optional<T> parse_arithmetic(std::string_view input, int base = 10) {
        T value{};
        auto result = std::from_chars(input.data(), input.data() + input.size(), value, base);
        if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
            return std::nullopt;
        }
        return {value};
    }

    // Non-asserting read, safe to call from worker threads.
    inline std::string slurp(const fs::path& p) {
        std::ifstream in{p, std::ios::binary};
        return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    }

    inline std::vector<std::string> read_lines(const fs::path& p) {
        std::ifstream in{p};
        REQUIRE(in.good());
        std::vector<std::string> lines{};
        std::string line{};
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    inline std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines{};
        std::istringstream in{text};
        std::string line{};
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    inline std::size_t count_entries(const fs::path& dir) {
        std::size_t n = 0U;
        for ([[maybe_unused]] const auto& entry : fs::directory_iterator{dir}) {
            ++n;
        }
        return n;
    }

    // Writes an executable /bin/sh script standing in for the verifier.
    inline fs::path write_stub_verifier(const fs::path& dir, std::string_view name, std::string_view body) {
        auto path = dir / name;
        write_file(path, "#!/bin/sh\n" + std::string{body} + "\n");
        fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
        return path;
    }

    // In-process verifier double; records every entry file it was handed.
    struct scripted_verifier final : external_verifier {
        std::function<verify_result(const fs::path&)> respond{};
        std::vector<fs::path> seen_entries{};
        std::vector<std::string> seen_contents{};
        std::vector<bool> existed_during_call{};
        std::mutex mutex{};

        explicit scripted_verifier(std::function<verify_result(const fs::path&)> fn) : respond{std::move(fn)} {}

        verify_result verify(const fs::path& entry_file, std::chrono::milliseconds) override {
            {
                std::lock_guard lock{mutex};
                seen_entries.push_back(entry_file);
                existed_during_call.push_back(fs::exists(entry_file));
                seen_contents.push_back(slurp(entry_file));
            }
            return respond(entry_file);
        }

        static scripted_verifier exiting(int code, std::string out = {}, std::string err = {}) {
            return scripted_verifier{[=](const fs::path&) -> verify_result {
                return verifier_completed{.exit_code = code, .stdout_output = out, .stderr_output = err};
            }};
        }

        static scripted_verifier timing_out() {
            return scripted_verifier{[](const fs::path&) -> verify_result { return verifier_timed_out{}; }};
        }
    };

    struct command_result {
        int exit_code{-1};
        std::string stdout_output{};
    };

    // Runs a command, capturing stdout; stderr is discarded.
    inline command_result run_command(const std::vector<std::string>& args) {
        int out_pipe[2]{};
        REQUIRE(::pipe(out_pipe) == 0);

        std::vector<char*> argv{};
        std::vector<std::string> storage{args};
        for (auto& arg : storage) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        auto pid = ::fork();
        REQUIRE(pid >= 0);
        if (pid == 0) {
            ::close(out_pipe[0]);
            ::dup2(out_pipe[1], STDOUT_FILENO);
            int devnull = ::open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDERR_FILENO);
            }
            ::execv(argv[0], argv.data());
            _exit(127);
        }

        ::close(out_pipe[1]);
        command_result result{};
        char chunk[4096]{};
        for (;;) {
            auto n = ::read(out_pipe[0], chunk, sizeof(chunk));
            if (n <= 0) {
                break;
            }
            result.stdout_output.append(chunk, static_cast<size_t>(n));
        }
        ::close(out_pipe[0]);

        int status = 0;
        REQUIRE(::waitpid(pid, &status, 0) == pid);
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        }
        return result;
    }

    inline constexpr std::string_view annotated_source = R"(use vstd::prelude::*;
use crate::util::helpers;

verus! {
fn add_one(x: u32) -> (r: u32)
    requires x < 100,
    ensures r == x + 1,
{
    x + 1
}
}
)";

    inline constexpr std::string_view plain_source = R"(use std::collections::HashMap;

fn main() {
    let m: HashMap<u32, u32> = HashMap::new();
    println!("{}", m.len());
}
)";

}  // namespace verex::test::detail
