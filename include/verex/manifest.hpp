#pragma once

#include "config.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace verex {

    struct extraction_record {
        std::filesystem::path source_path{};
        verification_outcome status{verification_outcome::skipped};
        std::string message{};
        // only populated for verified records; never serialized into the manifest line
        std::optional<std::string> code{};
        std::vector<std::string> dependencies{};
        std::optional<int64_t> verify_time_ms{};
    };

    // One JSON object, no trailing newline. Keys: source_path, status, message, dependencies, verify_time_ms.
    std::string to_json_line(const extraction_record& record);

    extraction_record parse_manifest_line(std::string_view line);

    // Writes <out_dir>/manifest.jsonl, creating out_dir and its parents. Returns the manifest path.
    std::filesystem::path write_manifest(
            const std::filesystem::path& out_dir, const std::vector<extraction_record>& records);

    std::vector<extraction_record> read_manifest(const std::filesystem::path& manifest_path);

}  // namespace verex
