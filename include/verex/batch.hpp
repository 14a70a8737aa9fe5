#pragma once

#include "config.hpp"
#include "manifest.hpp"
#include "verifier.hpp"

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <vector>

namespace verex {

    struct batch_result {
        std::vector<extraction_record> records{};
        std::filesystem::path manifest_path{};

        std::size_t count(verification_outcome outcome) const;
    };

    std::filesystem::path snippet_output_path(
            const std::filesystem::path& out_dir,
            const std::filesystem::path& repo_root,
            const std::filesystem::path& source_path);

    /*
     * Discovers sources under cfg.repo_root, processes at most cfg.limit of them in sorted
     * order and streams one JSON line per record to progress as soon as it is classified.
     * With cfg.jobs > 1 files are verified concurrently; progress lines and the manifest
     * keep sorted-path order either way.
     *
     * Throws std::runtime_error for run-fatal conditions (missing root, unwritable out_dir).
     */
    batch_result run_batch(const extraction_config& cfg, external_verifier& verifier, std::ostream& progress);

    void print_summary(const batch_result& result, std::ostream& os);

}  // namespace verex
