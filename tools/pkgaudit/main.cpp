/**
 * @file main.cpp
 * @brief pkgaudit CLI entry point
 *
 * Commands:
 *   scan      - Scan a package file or directory
 *   diff      - Scan the differences between two package versions
 *   version   - Show version information
 */

#include "pkgaudit/common.hpp"
#include "pkgaudit/config.hpp"
#include "pkgaudit/engine.hpp"
#include "pkgaudit/report.hpp"
#include "pkgaudit/version.hpp"

#include <charconv>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

void print_version()
{
    std::println("pkgaudit {} ({})", pkgaudit::kVersion, pkgaudit::kBuildId);
    std::println("  report: {}", pkgaudit::kReportSchemaVersion);
    std::println("  config: {}", pkgaudit::kConfigSchemaVersion);
}

void print_help()
{
    std::print(R"(pkgaudit - Static analysis of packages for malicious patterns

Usage: pkgaudit <command> [options]

Commands:
  scan        Scan a package file or directory
  diff        Scan the differences between two package versions
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Environment:
  PKGAUDIT_CFG        Configuration file used when --config is not given
  PKGAUDIT_LOG        Log level (trace, debug, info, warning, error, off)

Run 'pkgaudit <command> --help' for command-specific options.
)");
}

void print_scan_help()
{
    std::print(R"(Usage: pkgaudit scan <path> [options]

Scan a package file or directory, recursing into supported archives

Options:
  --config FILE             Configuration file
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --output FILE, -o         Report file (default: stdout)
  --min-score N             Drop findings scoring below N
  --help, -h                Show this help
)");
}

void print_diff_help()
{
    std::print(R"(Usage: pkgaudit diff <a> <b> [options]

Compare two package files or directories and scan archives that changed

Options:
  --config FILE             Configuration file
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --output FILE, -o         Report file (default: stdout)
  --min-score N             Drop findings scoring below N
  --help, -h                Show this help
)");
}

struct CommonOptions
{
    std::vector<std::string> positional;
    std::optional<std::string> config;
    std::string schema_dir;
    std::string output;
    std::optional<int> min_score;
    bool show_help;
};

[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> pkgaudit::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            pkgaudit::Error::make("MissingArgument",
                                  std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] pkgaudit::Result<int> parse_score(std::string_view value)
{
    int parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(
            pkgaudit::Error::make("InvalidArgument",
                                  std::string("Invalid --min-score value: ") + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] pkgaudit::Result<bool> handle_common_option(std::span<char*> args,
                                                          std::size_t idx,
                                                          std::string_view arg,
                                                          CommonOptions& options,
                                                          bool& skip_next)
{
    if (arg == "--config" || arg == "--schema-dir" || arg == "--output" || arg == "-o") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (arg == "--config") {
            options.config = *value;
        } else if (arg == "--schema-dir") {
            options.schema_dir = *value;
        } else {
            options.output = *value;
        }
        skip_next = true;
        return pkgaudit::Result<bool>{true};
    }
    if (arg == "--min-score") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        auto score = parse_score(*value);
        if (!score) {
            return std::unexpected(score.error());
        }
        options.min_score = *score;
        skip_next = true;
        return pkgaudit::Result<bool>{true};
    }
    return pkgaudit::Result<bool>{false};
}

[[nodiscard]] pkgaudit::Result<CommonOptions> parse_command_args(std::span<char*> args)
{
    CommonOptions options{.positional = {},
                          .config = std::nullopt,
                          .schema_dir = "schemas",
                          .output = std::string{},
                          .min_score = std::nullopt,
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
        auto handled = handle_common_option(args, idx, arg, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (*handled) {
            continue;
        }
        if (arg.starts_with("-")) {
            return std::unexpected(
                pkgaudit::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
        }
        options.positional.emplace_back(arg);
    }
    return options;
}

[[nodiscard]] std::optional<std::string> read_env(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

/// Configuration from --config, then PKGAUDIT_CFG, then built-in defaults
[[nodiscard]] pkgaudit::Result<pkgaudit::Config> load_config(const CommonOptions& options)
{
    auto path = options.config ? options.config : read_env("PKGAUDIT_CFG");
    if (!path) {
        return pkgaudit::Config{};
    }
    return pkgaudit::Config::load(*path, options.schema_dir);
}

[[nodiscard]] pkgaudit::VoidResult configure_logging(const pkgaudit::Config& config)
{
    const auto name = read_env("PKGAUDIT_LOG").value_or(config.log_level());
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return std::unexpected(
            pkgaudit::Error::make("InvalidArgument", "Unknown log level: " + name));
    }
    spdlog::set_level(level);
    return {};
}

/// Shared setup of scan and diff: configuration and logging
[[nodiscard]] pkgaudit::Result<pkgaudit::Config> prepare(const CommonOptions& options)
{
    auto config = load_config(options);
    if (!config) {
        return std::unexpected(config.error());
    }
    if (auto result = configure_logging(*config); !result) {
        return std::unexpected(result.error());
    }
    return config;
}

[[nodiscard]] int emit_report(const CommonOptions& options,
                              const pkgaudit::Config& config,
                              pkgaudit::report::ReportInput input)
{
    input.min_score = options.min_score.value_or(config.min_score());
    const auto report = pkgaudit::report::build_report(input);
    if (auto result = pkgaudit::report::write_report(report, options.output, options.schema_dir);
        !result) {
        std::println(stderr, "Error: report output failed: {}", result.error().message);
        return 1;
    }
    if (!options.output.empty()) {
        std::println(stderr, "[pkgaudit] Wrote {}", options.output);
    }
    return 0;
}

[[nodiscard]] int run_scan(const CommonOptions& options)
{
    auto config = prepare(options);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return 1;
    }
    const auto& path = options.positional.front();
    auto summary = pkgaudit::engine::scan_path(path, *config);
    if (!summary) {
        std::println(stderr, "Error: scan failed: {}", summary.error().message);
        return 1;
    }
    return emit_report(options,
                       *config,
                       pkgaudit::report::ReportInput{.input = path,
                                                     .findings = std::move(summary->findings)});
}

[[nodiscard]] int run_diff(const CommonOptions& options)
{
    auto config = prepare(options);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return 1;
    }
    const auto& a = options.positional[0];
    const auto& b = options.positional[1];
    auto summary = pkgaudit::engine::diff_paths(a, b, *config);
    if (!summary) {
        std::println(stderr, "Error: diff failed: {}", summary.error().message);
        return 1;
    }
    return emit_report(options,
                       *config,
                       pkgaudit::report::ReportInput{.input = a + ".." + b,
                                                     .findings = std::move(summary->findings),
                                                     .diff = std::move(summary->entries)});
}

int cmd_scan(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_command_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_scan_help();
        return 0;
    }
    if (options->positional.size() != 1) {
        std::println(stderr, "Error: exactly one <path> is required");
        print_scan_help();
        return 1;
    }
    return run_scan(*options);
}

int cmd_diff(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_command_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_diff_help();
        return 0;
    }
    if (options->positional.size() != 2) {
        std::println(stderr, "Error: <a> and <b> are required");
        print_diff_help();
        return 1;
    }
    return run_diff(*options);
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

        if (cmd == "scan") {
            return cmd_scan(sub_argc, sub_argv);
        }
        if (cmd == "diff") {
            return cmd_diff(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        std::println(stderr, "Error: {}", ex.what());
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
