#pragma once

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace verex {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    namespace utils {
        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n\f\v");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n\f\v");
            return value.substr(first, (last - first) + 1U);
        }

        // non-overlapping occurrences
        constexpr std::size_t count_occurrences(std::string_view text, std::string_view needle) {
            if (needle.empty()) {
                return 0U;
            }
            std::size_t count = 0U;
            for (auto pos = text.find(needle); pos != std::string_view::npos;
                 pos = text.find(needle, pos + needle.size())) {
                ++count;
            }
            return count;
        }

        namespace detail {
            constexpr std::size_t utf8_sequence_length(unsigned char lead) {
                if (lead < 0x80U) {
                    return 1U;
                }
                if (lead >= 0xC2U && lead <= 0xDFU) {
                    return 2U;
                }
                if (lead >= 0xE0U && lead <= 0xEFU) {
                    return 3U;
                }
                if (lead >= 0xF0U && lead <= 0xF4U) {
                    return 4U;
                }
                return 0U;
            }
        }  // namespace detail

        // Drops every byte that does not belong to a well-formed UTF-8 sequence.
        inline std::string drop_invalid_utf8(std::string_view input) {
            std::string out{};
            out.reserve(input.size());

            std::size_t i = 0U;
            while (i < input.size()) {
                auto lead = static_cast<unsigned char>(input[i]);
                auto len = detail::utf8_sequence_length(lead);
                if (len == 0U || i + len > input.size()) {
                    ++i;
                    continue;
                }

                bool valid = true;
                for (std::size_t k = 1U; k < len; ++k) {
                    auto cont = static_cast<unsigned char>(input[i + k]);
                    if ((cont & 0xC0U) != 0x80U) {
                        valid = false;
                        break;
                    }
                }
                if (valid && len >= 3U) {
                    auto second = static_cast<unsigned char>(input[i + 1U]);
                    // overlong forms, surrogates and code points past U+10FFFF
                    if ((lead == 0xE0U && second < 0xA0U) || (lead == 0xEDU && second > 0x9FU) ||
                        (lead == 0xF0U && second < 0x90U) || (lead == 0xF4U && second > 0x8FU)) {
                        valid = false;
                    }
                }

                if (!valid) {
                    ++i;
                    continue;
                }
                out.append(input.substr(i, len));
                i += len;
            }
            return out;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace verex
