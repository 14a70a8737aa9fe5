#pragma once

#include "config.hpp"

#include <cstddef>
#include <string_view>

namespace verex {

    // Cheap triage deciding whether a file is worth the isolate+verify path.
    class token_heuristic {
      public:
        explicit token_heuristic(vocabulary markers);

        bool contains_marker(std::string_view text) const;

        // Sum over markers of the number of non-overlapping occurrences.
        std::size_t score(std::string_view text) const;

        const vocabulary& markers() const { return markers_; }

      private:
        vocabulary markers_;
    };

}  // namespace verex
