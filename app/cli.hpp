#pragma once

#include "verex.hpp"

#include <optional>

namespace verex::cli {

    std::optional<int> parse_cli(int argc, char** argv, extraction_config& cfg);
    int run_extraction(const extraction_config& cfg);

}  // namespace verex::cli
