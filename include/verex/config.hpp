#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace verex {

    using namespace std::string_view_literals;

    /*
     * Verex Extraction Config Options
     *
     * Discovery
     * - repo_root: Root of the source tree to scan.
     * - extension: Source file extension to collect (including the dot).
     * - exclude_dirs: Path components that prune a file from discovery.
     * - limit: Maximum number of files processed, applied after sorting.
     *
     * Triage
     * - markers: Heuristic vocabulary; a file is attempted when any marker occurs.
     *
     * Verification
     * - verifier_path: Verifier executable, bare name resolved on PATH.
     * - verify_timeout_ms: Wall-clock budget for one verifier invocation.
     * - temp_root: Parent directory for isolated crates (system temp dir when unset).
     * - jobs: Worker concurrency; 1 keeps the run strictly sequential.
     *
     * Output
     * - out_dir: Directory receiving manifest.jsonl (created on demand).
     * - write_snippets: Also write verified snippet bodies under out_dir/snippets.
     * - quiet/verbose: Suppress progress and summary / trace each file on stderr.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved config and exit.
     */

    enum class verification_outcome : uint8_t { skipped, verified, failed, timeout, error };

    inline constexpr std::string_view to_string(verification_outcome outcome) {
        switch (outcome) {
            case verification_outcome::skipped:
                return "skipped"sv;
            case verification_outcome::verified:
                return "verified"sv;
            case verification_outcome::failed:
                return "failed"sv;
            case verification_outcome::timeout:
                return "timeout"sv;
            case verification_outcome::error:
                return "error"sv;
        }
        return "error"sv;
    }

    inline constexpr bool try_parse_verification_outcome(std::string_view text, verification_outcome& out) {
        if (text == "skipped"sv) {
            out = verification_outcome::skipped;
            return true;
        }
        if (text == "verified"sv) {
            out = verification_outcome::verified;
            return true;
        }
        if (text == "failed"sv) {
            out = verification_outcome::failed;
            return true;
        }
        if (text == "timeout"sv) {
            out = verification_outcome::timeout;
            return true;
        }
        if (text == "error"sv) {
            out = verification_outcome::error;
            return true;
        }
        return false;
    }

    inline constexpr auto verification_block_opener = "verus!"sv;

    using vocabulary = std::vector<std::string>;

    inline vocabulary default_vocabulary() {
        return {"verus!",
                "#[verus::",
                "requires",
                "ensures",
                "decreases",
                "invariant",
                "ghost",
                "proof",
                "spec",
                "exec",
                "reveal",
                "opens_invariants"};
    }

    inline std::vector<std::string> default_exclude_dirs() {
        return {"target", "tests", "examples", "benches", "docs", "vendor", ".git"};
    }

    struct extraction_config {
        std::filesystem::path repo_root{"."};
        std::string extension{".rs"};
        std::vector<std::string> exclude_dirs{default_exclude_dirs()};
        std::optional<std::size_t> limit{};

        vocabulary markers{default_vocabulary()};

        std::filesystem::path verifier_path{"verus"};
        int verify_timeout_ms{30'000};
        std::optional<std::filesystem::path> temp_root{};
        unsigned jobs{1U};

        std::filesystem::path out_dir{"./extracted_snippets"};
        bool write_snippets{false};
        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
    };

    inline constexpr auto manifest_filename = "manifest.jsonl"sv;
    inline constexpr auto snippets_dirname = "snippets"sv;

}  // namespace verex
