#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace verex {

    struct discovery_options {
        std::string extension{".rs"};
        std::vector<std::string> exclude_dirs{};
    };

    bool is_excluded_path(const std::filesystem::path& path, const std::vector<std::string>& exclude_dirs);

    // Recursive, sorted enumeration of source files under root. Throws when root is not a directory.
    std::vector<std::filesystem::path> discover_sources(
            const std::filesystem::path& root, const discovery_options& options);

}  // namespace verex
