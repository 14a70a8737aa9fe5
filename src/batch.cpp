#include "verex/batch.hpp"

#include "verex/discovery.hpp"
#include "verex/extract.hpp"
#include "verex/format.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>

using namespace verex::literals;
namespace fs = std::filesystem;

namespace verex {

    namespace detail {

        // Collects records by discovery index and streams the contiguous completed prefix,
        // so progress lines come out whole and in sorted order whatever finishes first.
        class ordered_progress {
          public:
            ordered_progress(std::size_t count, std::ostream& progress, const extraction_config& cfg)
                    : slots_(count), progress_{progress}, cfg_{cfg} {}

            void complete(std::size_t index, extraction_record record) {
                std::lock_guard lock{mutex_};
                slots_[index] = std::move(record);
                while (next_ < slots_.size() && slots_[next_]) {
                    emit(*slots_[next_]);
                    ++next_;
                }
            }

            std::vector<extraction_record> take_records() {
                std::lock_guard lock{mutex_};
                std::vector<extraction_record> records{};
                records.reserve(slots_.size());
                for (auto& slot : slots_) {
                    if (slot) {
                        records.push_back(std::move(*slot));
                    }
                }
                return records;
            }

          private:
            void emit(const extraction_record& record) {
                if (cfg_.verbose) {
                    std::cerr << "[verex] " << record.source_path.string() << ": " << to_string(record.status)
                              << '\n';
                }
                if (!cfg_.quiet) {
                    progress_ << to_json_line(record) << '\n' << std::flush;
                }
            }

            std::mutex mutex_{};
            std::vector<std::optional<extraction_record>> slots_;
            std::size_t next_{0U};
            std::ostream& progress_;
            const extraction_config& cfg_;
        };

        static void process_all(
                const std::vector<fs::path>& sources,
                const extractor& ex,
                ordered_progress& sink,
                unsigned jobs) {
            auto worker_count = std::min<std::size_t>(std::max(jobs, 1U), sources.size());
            if (worker_count <= 1U) {
                for (std::size_t i = 0; i < sources.size(); ++i) {
                    sink.complete(i, ex.attempt_extract(sources[i]));
                }
                return;
            }

            std::atomic<std::size_t> next_index{0U};
            std::mutex error_mutex{};
            std::exception_ptr first_error{};

            auto work = [&] {
                try {
                    for (auto i = next_index.fetch_add(1U); i < sources.size(); i = next_index.fetch_add(1U)) {
                        sink.complete(i, ex.attempt_extract(sources[i]));
                    }
                } catch (const std::exception&) {
                    std::lock_guard lock{error_mutex};
                    if (!first_error) {
                        first_error = std::current_exception();
                    }
                    // drain the queue so the other workers stop picking up files
                    next_index.store(sources.size());
                }
            };

            debug_log("verifying ", sources.size(), " files on ", worker_count, " workers");
            {
                std::vector<std::jthread> workers{};
                workers.reserve(worker_count);
                for (std::size_t w = 0; w < worker_count; ++w) {
                    workers.emplace_back(work);
                }
            }

            if (first_error) {
                std::rethrow_exception(first_error);
            }
        }

        static void write_snippets(const extraction_config& cfg, const std::vector<extraction_record>& records) {
            for (const auto& record : records) {
                if (record.status != verification_outcome::verified || !record.code) {
                    continue;
                }

                auto path = snippet_output_path(cfg.out_dir, cfg.repo_root, record.source_path);
                std::error_code ec{};
                fs::create_directories(path.parent_path(), ec);
                if (ec) {
                    throw std::runtime_error("failed to create directory: {}"_format(path.parent_path().string()));
                }

                std::ofstream out{path, std::ios::binary | std::ios::trunc};
                out << *record.code;
                if (!out) {
                    throw std::runtime_error("failed to write {}"_format(path.string()));
                }
            }
        }

    }  // namespace detail

    std::size_t batch_result::count(verification_outcome outcome) const {
        return static_cast<std::size_t>(
                std::ranges::count_if(records, [outcome](const auto& r) { return r.status == outcome; }));
    }

    fs::path snippet_output_path(const fs::path& out_dir, const fs::path& repo_root, const fs::path& source_path) {
        std::error_code ec{};
        auto relative = fs::relative(source_path, repo_root, ec);
        if (ec || relative.empty() || *relative.begin() == "..") {
            relative = source_path.filename();
        }

        // mirrors the source layout; distinct sources never share a snippet file
        return out_dir / snippets_dirname / relative;
    }

    batch_result run_batch(const extraction_config& cfg, external_verifier& verifier, std::ostream& progress) {
        auto sources = discover_sources(
                cfg.repo_root, discovery_options{.extension = cfg.extension, .exclude_dirs = cfg.exclude_dirs});
        if (cfg.limit && *cfg.limit < sources.size()) {
            sources.resize(*cfg.limit);
        }
        debug_log("discovered ", sources.size(), " candidate files under ", cfg.repo_root.string());

        extractor ex{cfg, verifier};
        detail::ordered_progress sink{sources.size(), progress, cfg};
        detail::process_all(sources, ex, sink, cfg.jobs);

        batch_result result{};
        result.records = sink.take_records();
        result.manifest_path = write_manifest(cfg.out_dir, result.records);

        if (cfg.write_snippets) {
            detail::write_snippets(cfg, result.records);
        }
        return result;
    }

    void print_summary(const batch_result& result, std::ostream& os) {
        os << "processed " << result.records.size() << " files:";
        for (auto outcome :
             {verification_outcome::verified,
              verification_outcome::failed,
              verification_outcome::timeout,
              verification_outcome::skipped,
              verification_outcome::error}) {
            os << ' ' << to_string(outcome) << '=' << result.count(outcome);
        }
        os << '\n';
        os << "manifest: " << result.manifest_path.string() << '\n';
    }

}  // namespace verex
