#pragma once

#include "config.hpp"
#include "heuristic.hpp"
#include "manifest.hpp"
#include "verifier.hpp"

#include <filesystem>
#include <string_view>

namespace verex {

    inline constexpr auto skipped_message = "no_verus_tokens"sv;
    inline constexpr auto timeout_message = "verification_timeout"sv;

    std::string read_source_text(const std::filesystem::path& path);

    /*
     * Per-file pipeline: triage, isolate, verify, classify.
     *
     * attempt_extract never throws for per-file problems; unreadable sources and
     * isolation/invocation failures come back as verification_outcome::error records.
     * The isolated crate of an attempt is gone by the time the record is returned.
     */
    class extractor {
      public:
        extractor(const extraction_config& cfg, external_verifier& verifier);

        extraction_record attempt_extract(const std::filesystem::path& source_path) const;

        // Classification on already-loaded text; may throw on isolation failure.
        extraction_record classify(const std::filesystem::path& source_path, const std::string& text) const;

      private:
        const extraction_config& cfg_;
        external_verifier& verifier_;
        token_heuristic heuristic_;
    };

}  // namespace verex
