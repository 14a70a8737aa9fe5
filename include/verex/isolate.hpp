#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace verex {

    inline constexpr std::string_view isolated_dir_prefix{"verus_extract_"};

    struct isolation_options {
        std::optional<std::filesystem::path> temp_root{};
    };

    /*
     * Owns one temporary crate:
     *
     *   <root>/Cargo.toml
     *   <root>/src/lib.rs
     *
     * The directory is removed when the handle is destroyed. Move-only; a moved-from
     * handle owns nothing.
     */
    class isolated_unit {
      public:
        explicit isolated_unit(std::filesystem::path root);
        ~isolated_unit();

        isolated_unit(const isolated_unit&) = delete;
        isolated_unit& operator=(const isolated_unit&) = delete;

        isolated_unit(isolated_unit&& other) noexcept;
        isolated_unit& operator=(isolated_unit&& other) noexcept;

        const std::filesystem::path& root() const { return root_; }
        std::filesystem::path entry_file() const;
        std::filesystem::path manifest_file() const;

      private:
        void release() noexcept;

        std::filesystem::path root_{};
    };

    // Returns the snippet unchanged when it already opens a verification block.
    std::string wrap_verification_block(std::string_view snippet);

    std::string_view crate_descriptor();

    isolated_unit isolate_snippet(std::string_view snippet, const isolation_options& options = {});

}  // namespace verex
