#include "cli.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace verex::literals;

namespace verex::cli {

    namespace detail {

        namespace fs = std::filesystem;

        struct persisted_config {
            std::optional<std::string> verifier{};
            std::optional<int> timeout_ms{};
            std::optional<unsigned> jobs{};
            std::optional<std::string> extension{};
            std::optional<std::vector<std::string>> exclude_dirs{};
            std::optional<std::vector<std::string>> markers{};
            std::optional<bool> write_snippets{};
            struct glaze {
                using T = persisted_config;
                static constexpr auto value = glz::object(
                        &T::verifier,
                        &T::timeout_ms,
                        &T::jobs,
                        &T::extension,
                        &T::exclude_dirs,
                        &T::markers,
                        &T::write_snippets);
            };
        };

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open {}"_format(path.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read " + path.string());
            }
            return ss.str();
        }

        static persisted_config read_config_file(const fs::path& path) {
            persisted_config value{};
            auto json = read_text_file(path);
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json);
            if (ec) {
                throw std::runtime_error("failed to parse json file {}"_format(path.string()));
            }
            return value;
        }

        static void apply_config_file(const persisted_config& file, extraction_config& cfg) {
            if (file.verifier) {
                cfg.verifier_path = *file.verifier;
            }
            if (file.timeout_ms) {
                cfg.verify_timeout_ms = *file.timeout_ms;
            }
            if (file.jobs) {
                cfg.jobs = *file.jobs;
            }
            if (file.extension) {
                cfg.extension = *file.extension;
            }
            if (file.exclude_dirs) {
                cfg.exclude_dirs = *file.exclude_dirs;
            }
            if (file.markers) {
                cfg.markers = *file.markers;
            }
            if (file.write_snippets) {
                cfg.write_snippets = *file.write_snippets;
            }
        }

        // keeps the millisecond conversion within int
        static constexpr int max_timeout_seconds = std::numeric_limits<int>::max() / 1000;

        static std::string normalize_extension(std::string_view ext) {
            auto trimmed = utils::trim_view(ext);
            if (trimmed.empty() || trimmed.front() == '.') {
                return std::string{trimmed};
            }
            return "." + std::string{trimmed};
        }

        static void print_config(const extraction_config& cfg, std::ostream& os) {
            os << "repo=" << cfg.repo_root.string() << '\n';
            os << "out=" << cfg.out_dir.string() << '\n';
            os << "limit=" << (cfg.limit ? std::to_string(*cfg.limit) : "<none>") << '\n';
            os << "verifier=" << cfg.verifier_path.string() << '\n';
            os << "timeout_ms=" << cfg.verify_timeout_ms << '\n';
            os << "jobs=" << cfg.jobs << '\n';
            os << "extension=" << cfg.extension << '\n';
            os << "exclude=" << utils::join_with_separator(cfg.exclude_dirs, ",") << '\n';
            os << "markers=" << utils::join_with_separator(cfg.markers, ",") << '\n';
            os << "write_snippets=" << (cfg.write_snippets ? "true" : "false") << '\n';
        }

    }  // namespace detail

    int run_extraction(const extraction_config& cfg) {
        // a missing verifier aborts the run before any file is touched
        process_verifier verifier{cfg.verifier_path};
        debug_log("using verifier ", verifier.executable().string());

        auto result = run_batch(cfg, verifier, std::cout);
        if (!cfg.quiet) {
            print_summary(result, std::cerr);
        }
        return 0;
    }

    std::optional<int> parse_cli(int argc, char** argv, extraction_config& cfg) {
        CLI::App app{"verex: extract and verify Verus snippets from a source tree"};

        bool show_version = false;
        std::string repo_arg{std::filesystem::current_path().string()};
        std::string out_arg{cfg.out_dir.string()};
        int64_t limit_arg{0};
        std::string verifier_arg{cfg.verifier_path.string()};
        int timeout_arg{cfg.verify_timeout_ms / 1000};
        unsigned jobs_arg{cfg.jobs};
        std::vector<std::string> exclude_arg{};
        std::string ext_arg{cfg.extension};
        std::string config_arg{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--repo", repo_arg, "Path to the repository root");
        app.add_option("--out", out_arg, "Output directory for manifest");
        app.add_option("--limit", limit_arg, "Optional limit on number of files to process");
        app.add_option("--verifier", verifier_arg, "Verifier executable");
        app.add_option("--timeout", timeout_arg, "Per-snippet verification timeout in seconds");
        app.add_option("-j,--jobs", jobs_arg, "Number of files verified concurrently");
        app.add_option("--exclude", exclude_arg, "Directory name to skip (repeatable, replaces the defaults)");
        app.add_option("--ext", ext_arg, "Source file extension");
        app.add_option("--config", config_arg, "JSON config file");
        app.add_flag("--write-snippets", cfg.write_snippets, "Write verified snippets under <out>/snippets");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress progress lines and the summary");
        app.add_flag("--verbose", cfg.verbose, "Trace every classified file on stderr");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // --help exits cleanly; every other parse failure is a usage error
            auto rc = app.exit(e);
            return std::optional<int>{rc == 0 ? 0 : 2};
        }

        if (show_version) {
            std::cout << "verex 0.1.0\n";
            return std::optional<int>{0};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (!config_arg.empty()) {
            auto write_snippets_flag = cfg.write_snippets;
            detail::apply_config_file(detail::read_config_file(config_arg), cfg);
            cfg.write_snippets = cfg.write_snippets || write_snippets_flag;
        }

        auto given = [&app](std::string_view name) { return app.get_option(std::string{name})->count() > 0U; };

        cfg.repo_root = repo_arg;
        cfg.out_dir = out_arg;

        if (given("--limit")) {
            if (limit_arg < 0) {
                std::cerr << "invalid --limit value: " << limit_arg << " (expected >= 0)\n";
                return std::optional<int>{2};
            }
            cfg.limit = static_cast<std::size_t>(limit_arg);
        }
        if (given("--verifier")) {
            cfg.verifier_path = verifier_arg;
        }
        if (given("--timeout")) {
            if (timeout_arg <= 0 || timeout_arg > detail::max_timeout_seconds) {
                std::cerr << "invalid --timeout value: " << timeout_arg << " (expected 1.."
                          << detail::max_timeout_seconds << ")\n";
                return std::optional<int>{2};
            }
            cfg.verify_timeout_ms = timeout_arg * 1000;
        }
        if (given("--jobs")) {
            cfg.jobs = jobs_arg;
        }
        if (given("--exclude")) {
            cfg.exclude_dirs = exclude_arg;
        }
        if (given("--ext")) {
            cfg.extension = detail::normalize_extension(ext_arg);
        }

        if (cfg.jobs == 0U) {
            std::cerr << "invalid jobs value: 0 (expected >= 1)\n";
            return std::optional<int>{2};
        }
        if (cfg.verify_timeout_ms <= 0) {
            std::cerr << "invalid timeout: " << cfg.verify_timeout_ms << "ms (expected > 0)\n";
            return std::optional<int>{2};
        }
        if (cfg.extension.empty()) {
            std::cerr << "invalid --ext value: extension must be non-empty\n";
            return std::optional<int>{2};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace verex::cli
