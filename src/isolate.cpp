#include "verex/isolate.hpp"

#include "verex/config.hpp"
#include "verex/format.hpp"

extern "C" {
#include <stdlib.h>
}

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

using namespace verex::literals;
namespace fs = std::filesystem;

namespace verex {

    namespace detail {

        static constexpr auto cargo_toml = R"([package]
name = "verus_extract"
version = "0.1.0"
edition = "2021"

[dependencies]
verus = "*")"sv;

        static void write_text_file(const fs::path& path, std::string_view content) {
            std::ofstream out{path, std::ios::binary | std::ios::trunc};
            if (!out) {
                throw std::runtime_error("failed to open {}"_format(path.string()));
            }
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            if (!out) {
                throw std::runtime_error("failed to write {}"_format(path.string()));
            }
        }

        static fs::path make_unique_dir(const fs::path& parent) {
            auto pattern = (parent / "{}XXXXXX"_format(isolated_dir_prefix)).string();
            std::vector<char> buf(pattern.begin(), pattern.end());
            buf.push_back('\0');

            if (::mkdtemp(buf.data()) == nullptr) {
                throw std::runtime_error(
                        "failed to allocate isolated crate under {}: {}"_format(
                                parent.string(), std::strerror(errno)));
            }
            return fs::path{buf.data()};
        }

    }  // namespace detail

    isolated_unit::isolated_unit(fs::path root) : root_{std::move(root)} {}

    isolated_unit::~isolated_unit() {
        release();
    }

    isolated_unit::isolated_unit(isolated_unit&& other) noexcept : root_{std::exchange(other.root_, fs::path{})} {}

    isolated_unit& isolated_unit::operator=(isolated_unit&& other) noexcept {
        if (this != &other) {
            release();
            root_ = std::exchange(other.root_, fs::path{});
        }
        return *this;
    }

    fs::path isolated_unit::entry_file() const {
        return root_ / "src" / "lib.rs";
    }

    fs::path isolated_unit::manifest_file() const {
        return root_ / "Cargo.toml";
    }

    void isolated_unit::release() noexcept {
        if (root_.empty()) {
            return;
        }
        std::error_code ec{};
        fs::remove_all(root_, ec);
        if (ec) {
            debug_log("failed to remove isolated crate ", root_.string(), ": ", ec.message());
        }
        root_.clear();
    }

    std::string wrap_verification_block(std::string_view snippet) {
        if (snippet.find(verification_block_opener) != std::string_view::npos) {
            return std::string{snippet};
        }
        return "{} {{\n{}\n}}\n"_format(verification_block_opener, snippet);
    }

    std::string_view crate_descriptor() {
        return detail::cargo_toml;
    }

    isolated_unit isolate_snippet(std::string_view snippet, const isolation_options& options) {
        fs::path parent{};
        if (options.temp_root) {
            parent = *options.temp_root;
        }
        else {
            std::error_code ec{};
            parent = fs::temp_directory_path(ec);
            if (ec) {
                throw std::runtime_error("no temporary directory available: {}"_format(ec.message()));
            }
        }

        // owns the directory from here on, so a failed write below still cleans up
        isolated_unit unit{detail::make_unique_dir(parent)};

        std::error_code ec{};
        fs::create_directories(unit.entry_file().parent_path(), ec);
        if (ec) {
            throw std::runtime_error(
                    "failed to create directory: {}"_format(unit.entry_file().parent_path().string()));
        }

        detail::write_text_file(unit.entry_file(), wrap_verification_block(snippet));
        detail::write_text_file(unit.manifest_file(), detail::cargo_toml);

        debug_log("isolated snippet at ", unit.root().string());
        return unit;
    }

}  // namespace verex
