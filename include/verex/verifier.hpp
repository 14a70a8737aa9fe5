#pragma once

extern "C" {
#include <sys/types.h>
}

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace verex {

    struct verifier_completed {
        int exit_code{};
        std::string stdout_output{};
        std::string stderr_output{};
    };

    struct verifier_timed_out {};

    using verify_result = std::variant<verifier_completed, verifier_timed_out>;

    // Seam between the orchestrator and the external verification tool.
    // Implementations must be safe to call from several workers at once.
    class external_verifier {
      public:
        virtual ~external_verifier() = default;

        virtual verify_result verify(const std::filesystem::path& entry_file, std::chrono::milliseconds timeout) = 0;
    };

    namespace verifier_args {
        inline constexpr auto verify = std::string_view{"--verify"};
        inline constexpr auto crate_type_lib = std::string_view{"--crate-type=lib"};
    }  // namespace verifier_args

    // Owns a spawned child that leads its own process group. Unless released, destruction
    // SIGKILLs the whole group and reaps the child, so an exception between fork and wait
    // cannot leave the verifier running.
    class process_group_guard {
      public:
        explicit process_group_guard(pid_t pid) : pid_{pid} {}

        process_group_guard(const process_group_guard&) = delete;
        process_group_guard& operator=(const process_group_guard&) = delete;

        ~process_group_guard();

        pid_t pid() const { return pid_; }

        // The child was reaped by the caller; nothing left to clean up.
        void release() { pid_ = -1; }

        // Kills the group and blocks until the child is reaped. Throws if waitpid fails.
        void terminate();

      private:
        pid_t pid_{-1};
    };

    // Resolves an executable the way execvp would: paths containing '/' are taken as-is,
    // bare names are searched on PATH. Returns an empty path when nothing executable is found.
    std::filesystem::path find_executable(const std::filesystem::path& name);

    // Runs `<verifier> --verify --crate-type=lib <entry>` as a child process.
    class process_verifier final : public external_verifier {
      public:
        // Throws std::runtime_error when the executable cannot be resolved.
        explicit process_verifier(const std::filesystem::path& executable);

        verify_result verify(const std::filesystem::path& entry_file, std::chrono::milliseconds timeout) override;

        const std::filesystem::path& executable() const { return executable_; }

        std::vector<std::string> command_for(const std::filesystem::path& entry_file) const;

      private:
        std::filesystem::path executable_;
    };

}  // namespace verex
