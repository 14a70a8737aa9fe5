#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace verex {

    inline constexpr std::string_view import_keyword{"use"};

    // Collects the path after every `use` that starts a line, in order of appearance.
    // Duplicates are kept; lines with leading indentation do not match.
    std::vector<std::string> extract_dependencies(std::string_view text);

}  // namespace verex
