#include "verex/dependencies.hpp"

namespace verex {

    namespace detail {

        // Word characters and ':'. Bytes of multi-byte UTF-8 sequences count as word characters,
        // so non-ASCII identifiers are captured whole.
        static constexpr bool is_path_char(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
                   c == ':' || static_cast<unsigned char>(c) >= 0x80U;
        }

        static constexpr bool is_blank(char c) {
            return c == ' ' || c == '\t';
        }

        static std::string_view match_import(std::string_view line) {
            if (!line.starts_with(import_keyword)) {
                return {};
            }
            line.remove_prefix(import_keyword.size());

            std::size_t pos = 0U;
            while (pos < line.size() && is_blank(line[pos])) {
                ++pos;
            }
            if (pos == 0U) {
                return {};
            }

            auto end = pos;
            while (end < line.size() && is_path_char(line[end])) {
                ++end;
            }
            return line.substr(pos, end - pos);
        }

    }  // namespace detail

    std::vector<std::string> extract_dependencies(std::string_view text) {
        std::vector<std::string> deps{};

        while (!text.empty()) {
            auto eol = text.find('\n');
            auto line = text.substr(0, eol);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1U);
            }

            if (auto dep = detail::match_import(line); !dep.empty()) {
                deps.emplace_back(dep);
            }

            if (eol == std::string_view::npos) {
                break;
            }
            text.remove_prefix(eol + 1U);
        }

        return deps;
    }

}  // namespace verex
