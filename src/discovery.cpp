#include "verex/discovery.hpp"

#include "verex/format.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

using namespace verex::literals;
namespace fs = std::filesystem;

namespace verex {

    bool is_excluded_path(const fs::path& path, const std::vector<std::string>& exclude_dirs) {
        for (const auto& part : path) {
            auto name = part.string();
            if (std::ranges::find(exclude_dirs, name) != exclude_dirs.end()) {
                return true;
            }
        }
        return false;
    }

    std::vector<fs::path> discover_sources(const fs::path& root, const discovery_options& options) {
        std::error_code ec{};
        if (!fs::is_directory(root, ec)) {
            throw std::runtime_error("repository root is not a directory: {}"_format(root.string()));
        }

        std::vector<fs::path> sources{};
        auto it = fs::recursive_directory_iterator{root, fs::directory_options::skip_permission_denied, ec};
        if (ec) {
            throw std::runtime_error("failed to scan {}: {}"_format(root.string(), ec.message()));
        }

        for (auto end = fs::recursive_directory_iterator{}; it != end; it.increment(ec)) {
            if (ec) {
                throw std::runtime_error("failed to scan {}: {}"_format(root.string(), ec.message()));
            }

            std::error_code entry_ec{};
            if (!it->is_regular_file(entry_ec)) {
                continue;
            }

            const auto& path = it->path();
            if (path.extension().string() != options.extension) {
                continue;
            }
            if (is_excluded_path(path, options.exclude_dirs)) {
                continue;
            }
            sources.push_back(path);
        }

        std::ranges::sort(sources);
        return sources;
    }

}  // namespace verex
