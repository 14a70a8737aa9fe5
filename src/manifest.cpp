#include "verex/manifest.hpp"

#include "verex/format.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <stdexcept>
#include <system_error>

using namespace verex::literals;
namespace fs = std::filesystem;

namespace verex::detail {

    struct manifest_line_payload {
        std::string source_path{};
        std::string status{};
        std::string message{};
        std::vector<std::string> dependencies{};
        std::optional<int64_t> verify_time_ms{};
    };

}  // namespace verex::detail

namespace glz {

    template <>
    struct meta<verex::detail::manifest_line_payload> {
        using T = verex::detail::manifest_line_payload;
        static constexpr auto value = object(
                "source_path",
                &T::source_path,
                "status",
                &T::status,
                "message",
                &T::message,
                "dependencies",
                &T::dependencies,
                "verify_time_ms",
                &T::verify_time_ms);
    };

}  // namespace glz

namespace verex {

    std::string to_json_line(const extraction_record& record) {
        detail::manifest_line_payload payload{
                .source_path = record.source_path.string(),
                .status = std::string{to_string(record.status)},
                .message = record.message,
                .dependencies = record.dependencies,
                .verify_time_ms = record.verify_time_ms};

        std::string json{};
        auto ec = glz::write<glz::opts{.skip_null_members = false}>(payload, json);
        if (ec) {
            throw std::runtime_error("failed to serialize record for {}"_format(payload.source_path));
        }
        return json;
    }

    extraction_record parse_manifest_line(std::string_view line) {
        detail::manifest_line_payload payload{};
        std::string buffer{line};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(payload, buffer);
        if (ec) {
            throw std::runtime_error("failed to parse manifest line: {}"_format(glz::format_error(ec, buffer)));
        }

        extraction_record record{};
        if (!try_parse_verification_outcome(payload.status, record.status)) {
            throw std::runtime_error("unknown status in manifest line: {}"_format(payload.status));
        }
        record.source_path = payload.source_path;
        record.message = std::move(payload.message);
        record.dependencies = std::move(payload.dependencies);
        record.verify_time_ms = payload.verify_time_ms;
        return record;
    }

    fs::path write_manifest(const fs::path& out_dir, const std::vector<extraction_record>& records) {
        std::error_code ec{};
        fs::create_directories(out_dir, ec);
        if (ec) {
            throw std::runtime_error("failed to create directory: {}"_format(out_dir.string()));
        }

        auto manifest_path = out_dir / manifest_filename;
        std::ofstream out{manifest_path, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw std::runtime_error("failed to open {}"_format(manifest_path.string()));
        }
        for (const auto& record : records) {
            out << to_json_line(record) << '\n';
        }
        out.flush();
        if (!out) {
            throw std::runtime_error("failed to write {}"_format(manifest_path.string()));
        }
        return manifest_path;
    }

    std::vector<extraction_record> read_manifest(const fs::path& manifest_path) {
        std::ifstream in{manifest_path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("failed to open {}"_format(manifest_path.string()));
        }

        std::vector<extraction_record> records{};
        std::string line{};
        while (std::getline(in, line)) {
            if (utils::trim_view(line).empty()) {
                continue;
            }
            records.push_back(parse_manifest_line(line));
        }
        if (in.bad()) {
            throw std::runtime_error("failed to read {}"_format(manifest_path.string()));
        }
        return records;
    }

}  // namespace verex
