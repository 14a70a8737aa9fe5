#include "verex/heuristic.hpp"

#include <algorithm>
#include <utility>

namespace verex {

    token_heuristic::token_heuristic(vocabulary markers) : markers_{std::move(markers)} {
        std::erase_if(markers_, [](const std::string& marker) { return marker.empty(); });
    }

    bool token_heuristic::contains_marker(std::string_view text) const {
        return std::ranges::any_of(
                markers_, [text](const std::string& marker) { return text.find(marker) != std::string_view::npos; });
    }

    std::size_t token_heuristic::score(std::string_view text) const {
        std::size_t total = 0U;
        for (const auto& marker : markers_) {
            total += utils::count_occurrences(text, marker);
        }
        return total;
    }

}  // namespace verex
