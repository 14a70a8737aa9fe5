#include "verex/extract.hpp"

#include "verex/dependencies.hpp"
#include "verex/format.hpp"
#include "verex/isolate.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <variant>

using namespace verex::literals;
namespace fs = std::filesystem;

namespace verex {

    namespace detail {

        static std::string failure_message(const verifier_completed& completed) {
            if (auto err = utils::trim_view(completed.stderr_output); !err.empty()) {
                return std::string{err};
            }
            if (auto out = utils::trim_view(completed.stdout_output); !out.empty()) {
                return std::string{out};
            }
            return "verifier exited with code {}"_format(completed.exit_code);
        }

        static std::string error_message(const std::exception& e) {
            std::string_view what{e.what()};
            return what.empty() ? std::string{"extraction failed"} : std::string{what};
        }

        static int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
                    .count();
        }

    }  // namespace detail

    std::string read_source_text(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read {}"_format(path.string()));
        }
        return utils::drop_invalid_utf8(ss.str());
    }

    extractor::extractor(const extraction_config& cfg, external_verifier& verifier)
            : cfg_{cfg}, verifier_{verifier}, heuristic_{cfg.markers} {}

    extraction_record extractor::classify(const fs::path& source_path, const std::string& text) const {
        extraction_record record{.source_path = source_path};

        if (!heuristic_.contains_marker(text)) {
            record.status = verification_outcome::skipped;
            record.message = std::string{skipped_message};
            return record;
        }

        auto score = heuristic_.score(text);
        record.dependencies = extract_dependencies(text);

        auto unit = isolate_snippet(text, isolation_options{.temp_root = cfg_.temp_root});

        auto start = std::chrono::steady_clock::now();
        auto result = verifier_.verify(unit.entry_file(), std::chrono::milliseconds{cfg_.verify_timeout_ms});
        record.verify_time_ms = detail::elapsed_ms(start);

        std::visit(
                [&](const auto& outcome) {
                    using T = std::decay_t<decltype(outcome)>;
                    if constexpr (std::is_same_v<T, verifier_timed_out>) {
                        record.status = verification_outcome::timeout;
                        record.message = std::string{timeout_message};
                    }
                    else if (outcome.exit_code == 0) {
                        record.status = verification_outcome::verified;
                        record.message = "verified with score={}"_format(score);
                        record.code = text;
                    }
                    else {
                        record.status = verification_outcome::failed;
                        record.message = detail::failure_message(outcome);
                    }
                },
                result);

        return record;
    }

    extraction_record extractor::attempt_extract(const fs::path& source_path) const {
        std::string text{};
        try {
            text = read_source_text(source_path);
        } catch (const std::exception& e) {
            return extraction_record{
                    .source_path = source_path,
                    .status = verification_outcome::error,
                    .message = detail::error_message(e)};
        }

        try {
            return classify(source_path, text);
        } catch (const std::exception& e) {
            debug_log("extraction error for ", source_path.string(), ": ", e.what());
            return extraction_record{
                    .source_path = source_path,
                    .status = verification_outcome::error,
                    .message = detail::error_message(e),
                    .dependencies = extract_dependencies(text)};
        }
    }

}  // namespace verex
