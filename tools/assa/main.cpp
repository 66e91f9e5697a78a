/**
 * @file main.cpp
 * @brief ASSA CLI entry point
 *
 * Commands:
 *   analyze   - Score an infrastructure graph and write the report
 *   sample    - Write the built-in sample infrastructure
 *   version   - Show version information
 */

#include "assa/require_cpp23.hpp"

#include "assa/common.hpp"
#include "assa/config.hpp"
#include "assa/infrastructure_io.hpp"
#include "assa/json_io.hpp"
#include "assa/report.hpp"
#include "assa/report_json.hpp"
#include "assa/version.hpp"

#include <charconv>
#include <chrono>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace {

void print_version()
{
    std::println("assa {} ({})", assa::kVersion, assa::kBuildId);
    std::println("  model: {}", assa::kModelVersion);
    std::println("  alpha: {}", assa::kAmplificationAlpha);
}

void print_help()
{
    std::print(R"(ASSA - Attack Surface Score Aggregated

Usage: assa <command> [options]

Commands:
  analyze     Score an infrastructure graph and write the report
  sample      Write the built-in sample infrastructure
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'assa <command> --help' for command-specific options.
)");
}

void print_analyze_help()
{
    std::print(R"(Usage: assa analyze [options]

Score an infrastructure graph, find critical paths and plan mitigations

Options:
  --graph FILE              Path to infrastructure JSON (required)
  --config FILE             Analysis configuration file
  --output FILE, -o         Report file (default: assa_report.json)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --org-factor X            Organizational factor (> 0)
  --threshold X             Critical path probability threshold
  --budget X                Mitigation budget
  --cutoff N                Maximum path length in edges
  --generated-at TS         Report timestamp (default: current UTC time)
  --help, -h                Show this help

Output:
  <output> (assa_report.v1)
)");
}

void print_sample_help()
{
    std::print(R"(Usage: assa sample [options]

Write the built-in sample retail infrastructure

Options:
  --output FILE, -o         Output file (default: sample_infrastructure.json)
  --help, -h                Show this help

Output:
  <output> (assa_infrastructure.v1)
)");
}

struct AnalyzeOptions
{
    std::string graph;
    std::optional<std::string> config;
    std::string output;
    std::string schema_dir;
    std::optional<double> org_factor;
    std::optional<double> threshold;
    std::optional<double> budget;
    std::optional<std::size_t> cutoff;
    std::optional<std::string> generated_at;
    bool show_help;
};

struct SampleOptions
{
    std::string output;
    bool show_help;
};

std::string current_time_utc()
{
    const auto now = std::chrono::system_clock::now();
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", std::chrono::floor<std::chrono::seconds>(now));
}

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> assa::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size()) {
        return std::unexpected(
            assa::Error::make("MissingArgument",
                              std::string("Missing value for option: ") + std::string(option)));
    }
    const char* value_ptr = args[value_index];
    if (value_ptr == nullptr) {
        return std::unexpected(
            assa::Error::make("MissingArgument",
                              std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(value_ptr);
}

template <typename T>
[[nodiscard]] assa::Result<T> parse_number_value(std::string_view value, std::string_view option)
{
    T parsed{};
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(assa::Error::make(
            "InvalidArgument",
            std::format("Invalid {} value: {}", option, value)));
    }
    return parsed;
}

template <typename T>
[[nodiscard]] assa::VoidResult read_number_option(std::span<char*> args,
                                                  std::size_t index,
                                                  std::string_view option,
                                                  std::optional<T>& target)
{
    auto value = read_option_value(args, index, option);
    if (!value) {
        return std::unexpected(value.error());
    }
    auto parsed = parse_number_value<T>(*value, option);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    target = *parsed;
    return {};
}

[[nodiscard]] assa::VoidResult set_analyze_option(std::string_view arg,
                                                    std::span<char*> args,
                                                    std::size_t index,
                                                    AnalyzeOptions& options,
                                                    bool& skip_next)
{
    auto assign = [&](std::string& target) -> assa::VoidResult {
        auto value = read_option_value(args, index, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        target = *value;
        skip_next = true;
        return {};
    };
    auto assign_number = [&](auto& target) -> assa::VoidResult {
        if (auto result = read_number_option(args, index, arg, target); !result) {
            return std::unexpected(result.error());
        }
        skip_next = true;
        return {};
    };

    if (arg == "--graph") {
        return assign(options.graph);
    }
    if (arg == "--output" || arg == "-o") {
        return assign(options.output);
    }
    if (arg == "--schema-dir") {
        return assign(options.schema_dir);
    }
    if (arg == "--config") {
        std::string path;
        auto handled = assign(path);
        if (handled) {
            options.config = std::move(path);
        }
        return handled;
    }
    if (arg == "--generated-at") {
        std::string timestamp;
        auto handled = assign(timestamp);
        if (handled) {
            options.generated_at = std::move(timestamp);
        }
        return handled;
    }
    if (arg == "--org-factor") {
        return assign_number(options.org_factor);
    }
    if (arg == "--threshold") {
        return assign_number(options.threshold);
    }
    if (arg == "--budget") {
        return assign_number(options.budget);
    }
    if (arg == "--cutoff") {
        return assign_number(options.cutoff);
    }
    return std::unexpected(
        assa::Error::make("InvalidArgument", std::format("Unknown option: {}", arg)));
}

[[nodiscard]] assa::Result<AnalyzeOptions> parse_analyze_args(std::span<char*> args)
{
    AnalyzeOptions options{.graph = std::string{},
                           .config = std::nullopt,
                           .output = "assa_report.json",
                           .schema_dir = "schemas",
                           .org_factor = std::nullopt,
                           .threshold = std::nullopt,
                           .budget = std::nullopt,
                           .cutoff = std::nullopt,
                           .generated_at = std::nullopt,
                           .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_analyze_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
    }
    return options;
}

[[nodiscard]] assa::Result<SampleOptions> parse_sample_args(std::span<char*> args)
{
    SampleOptions options{.output = "sample_infrastructure.json", .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--output" || arg == "-o") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.output = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(
            assa::Error::make("InvalidArgument", std::format("Unknown option: {}", arg)));
    }
    return options;
}

[[nodiscard]] assa::Result<assa::config::AnalysisConfig>
resolve_config(const AnalyzeOptions& options)
{
    assa::config::AnalysisConfig config;
    if (options.config) {
        auto loaded = assa::config::load_config(*options.config, options.schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (options.org_factor) {
        config.org_factor = *options.org_factor;
    }
    if (options.threshold) {
        config.critical_path_threshold = *options.threshold;
    }
    if (options.budget) {
        config.budget = *options.budget;
    }
    if (options.cutoff) {
        config.path_cutoff = *options.cutoff;
    }

    if (auto valid = assa::config::validate_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

[[nodiscard]] assa::VoidResult ensure_parent_directory(const std::filesystem::path& file)
{
    const auto parent = file.parent_path();
    if (parent.empty()) {
        return {};
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return std::unexpected(assa::Error::make(
            "IOError",
            std::format("Failed to create output directory {}: {}", parent.string(), ec.message())));
    }
    return {};
}

[[nodiscard]] int run_analyze(const AnalyzeOptions& options)
{
    auto config = resolve_config(options);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return 1;
    }

    auto graph = assa::model::load_infrastructure(options.graph, options.schema_dir);
    if (!graph) {
        std::println(stderr, "Error: failed to load infrastructure: {}", graph.error().message);
        return 1;
    }
    std::println("[analyze] Loaded {} assets, {} edges",
                 graph->asset_count(),
                 graph->edge_count());

    const assa::report::ReportBuilder builder(std::move(*config));
    auto report = builder.build(*graph, options.generated_at.value_or(current_time_utc()));
    if (!report) {
        std::println(stderr, "Error: analysis failed: {}", report.error().message);
        return 1;
    }

    const std::filesystem::path output_file(options.output);
    if (auto result = ensure_parent_directory(output_file); !result) {
        std::println(stderr, "Error: {}", result.error().message);
        return 1;
    }
    auto document = assa::report::report_to_json(*report);
    if (auto result = assa::report::write_report(output_file, document, options.schema_dir);
        !result) {
        std::println(stderr, "Error: failed to write report: {}", result.error().message);
        return 1;
    }

    std::println("[analyze] Wrote {}", output_file.string());
    for (const auto& line : assa::report::summary_lines(*report)) {
        std::println("{}", line);
    }
    return 0;
}

[[nodiscard]] int run_sample(const SampleOptions& options)
{
    auto graph = assa::model::sample_infrastructure();
    if (!graph) {
        std::println(stderr, "Error: {}", graph.error().message);
        return 1;
    }

    const std::filesystem::path output_file(options.output);
    if (auto result = ensure_parent_directory(output_file); !result) {
        std::println(stderr, "Error: {}", result.error().message);
        return 1;
    }
    if (auto result = assa::common::write_canonical_json_file(
            output_file, assa::model::infrastructure_to_json(*graph));
        !result) {
        std::println(stderr, "Error: failed to write sample: {}", result.error().message);
        return 1;
    }

    std::println("[sample] Wrote {}", output_file.string());
    std::println("  assets: {}", graph->asset_count());
    std::println("  edges: {}", graph->edge_count());
    return 0;
}

int cmd_analyze(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_analyze_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_analyze_help();
        return 0;
    }
    if (options->graph.empty()) {
        std::println(stderr, "Error: --graph is required");
        print_analyze_help();
        return 1;
    }
    return run_analyze(*options);
}

int cmd_sample(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_sample_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_sample_help();
        return 0;
    }
    return run_sample(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "analyze") {
            return cmd_analyze(sub_argc, sub_argv);
        }
        if (cmd == "sample") {
            return cmd_sample(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
