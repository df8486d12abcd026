/**
 * @file main.cpp
 * @brief proofrank CLI entry point
 *
 * Commands:
 *   suggest   - Suggest per-file prover order from gnatprove reports
 *   summary   - Summarize proof effort per file
 *   version   - Show version information
 */

#include "proofrank/require_cpp23.hpp"

#include "proofrank/common.hpp"
#include "proofrank/heuristics.hpp"
#include "proofrank/proof_tree.hpp"
#include "proofrank/report.hpp"
#include "proofrank/report_loader.hpp"
#include "proofrank/summary.hpp"
#include "proofrank/version.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>

namespace {

void print_version()
{
    std::println("proofrank {} ({})", proofrank::kVersion, proofrank::kBuildId);
    std::println("  report schema: {}", proofrank::kReportSchemaVersion);
    std::println("  output schema: {}", proofrank::kOutputSchemaVersion);
}

void print_help()
{
    std::print(R"(proofrank - prover timing analysis for gnatprove reports

Usage: proofrank <command> [options]

Commands:
  suggest     Suggest which provers to try first, per source file
  summary     Summarize proof effort per source file
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'proofrank <command> --help' for command-specific options.
)");
}

void print_command_help(std::string_view command, std::string_view description)
{
    std::print(R"(Usage: proofrank {} [options]

{}

Options:
  --dir DIR, -d DIR        Directory searched recursively for .spark files (required)
  --format text|json       Output format (default: text)
  --output FILE, -o        Output file (default: stdout)
  --schema-dir DIR         Path to schema directory (default: ./schemas)
  --verbose, -V            Report each loaded file on stderr
  --help, -h               Show this help
)",
               command,
               description);
}

void print_suggest_help()
{
    print_command_help("suggest",
                       "Order provers per source file: least failed time first, then most "
                       "success time.\nOnly provers that were actually run are considered.");
}

void print_summary_help()
{
    print_command_help("summary", "Summarize checks, unproved checks and prover time per file");
}

struct AnalysisOptions
{
    std::string directory;
    std::string schema_dir;
    std::optional<std::string> output;
    proofrank::report::OutputFormat format;
    bool verbose;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> proofrank::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            proofrank::Error::make("MissingArgument",
                                   std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] auto set_analysis_option(std::string_view arg,
                                       // CLI parsing signature is stable.
                                       // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                       std::span<char*> args,
                                       std::size_t idx,
                                       AnalysisOptions& options,
                                       bool& skip_next) -> proofrank::Result<bool>
{
    if (arg == "--help" || arg == "-h") {
        options.show_help = true;
        return proofrank::Result<bool>{true};
    }
    if (arg == "--verbose" || arg == "-V") {
        options.verbose = true;
        return proofrank::Result<bool>{true};
    }
    if (arg != "--dir" && arg != "-d" && arg != "--format" && arg != "--output" && arg != "-o"
        && arg != "--schema-dir") {
        return proofrank::Result<bool>{false};
    }

    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    skip_next = true;
    if (arg == "--dir" || arg == "-d") {
        options.directory = *value;
    } else if (arg == "--output" || arg == "-o") {
        options.output = *value;
    } else if (arg == "--schema-dir") {
        options.schema_dir = *value;
    } else {
        auto format = proofrank::report::parse_output_format(*value);
        if (!format) {
            return std::unexpected(format.error());
        }
        options.format = *format;
    }
    return proofrank::Result<bool>{true};
}

[[nodiscard]] proofrank::Result<AnalysisOptions> parse_analysis_args(std::span<char*> args)
{
    AnalysisOptions options{.directory = std::string{},
                            .schema_dir = "schemas",
                            .output = std::nullopt,
                            .format = proofrank::report::OutputFormat::kText,
                            .verbose = false,
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
        std::string_view arg(arg_ptr);
        auto handled = set_analysis_option(arg, args, static_cast<std::size_t>(i), options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(
                proofrank::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] proofrank::Result<proofrank::tree::ProofTree>
load_reports(const AnalysisOptions& options, std::string_view tag)
{
    auto files = proofrank::common::find_files(options.directory,
                                               proofrank::loader::kReportExtension);
    if (!files) {
        return std::unexpected(files.error());
    }
    if (files->empty()) {
        std::println(stderr,
                     "[{}] warning: no {} files found below {}",
                     tag,
                     proofrank::loader::kReportExtension,
                     options.directory);
    }

    const proofrank::loader::ReportLoader loader(options.schema_dir);
    proofrank::tree::ProofTree tree;
    for (const auto& file : *files) {
        if (auto loaded = loader.load_file(file, options.directory, tree); !loaded) {
            return std::unexpected(loaded.error());
        }
        if (options.verbose) {
            std::println(stderr, "[{}] loaded {} ({} nodes)", tag, file.string(), tree.size());
        }
    }
    return tree;
}

[[nodiscard]] std::optional<std::filesystem::path> output_path_of(const AnalysisOptions& options)
{
    if (!options.output) {
        return std::nullopt;
    }
    return std::filesystem::path(*options.output);
}

[[nodiscard]] int emit(const proofrank::report::RenderedReport& rendered,
                       const AnalysisOptions& options,
                       std::string_view tag)
{
    if (auto write = proofrank::report::write_report(rendered, output_path_of(options)); !write) {
        std::println(stderr, "Error: {} output failed: {}", tag, write.error().message);
        return 1;
    }
    std::println(stderr, "[{}] {}", tag, rendered.summary);
    if (options.output) {
        std::println(stderr, "  output: {}", *options.output);
    }
    return 0;
}

int run_suggest(const AnalysisOptions& options)
{
    auto tree = load_reports(options, "suggest");
    if (!tree) {
        std::println(stderr, "Error: suggest failed: {}", tree.error().message);
        return 1;
    }
    const auto files = proofrank::heuristics::find_optimum(*tree);
    return emit(proofrank::report::render_suggestion(files, options.format), options, "suggest");
}

int run_summary(const AnalysisOptions& options)
{
    auto tree = load_reports(options, "summary");
    if (!tree) {
        std::println(stderr, "Error: summary failed: {}", tree.error().message);
        return 1;
    }
    const auto files = proofrank::summary::summarize(*tree);
    return emit(proofrank::report::render_summary(files, options.format), options, "summary");
}

int cmd_suggest(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_analysis_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_suggest_help();
        return 0;
    }
    if (options->directory.empty()) {
        std::println(stderr, "Error: --dir is required");
        print_suggest_help();
        return 1;
    }
    return run_suggest(*options);
}

int cmd_summary(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_analysis_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_summary_help();
        return 0;
    }
    if (options->directory.empty()) {
        std::println(stderr, "Error: --dir is required");
        print_summary_help();
        return 1;
    }
    return run_summary(*options);
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

        if (cmd == "suggest") {
            return cmd_suggest(sub_argc, sub_argv);
        }
        if (cmd == "summary") {
            return cmd_summary(sub_argc, sub_argv);
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
