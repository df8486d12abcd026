/**
 * @file report.cpp
 * @brief Text and JSON rendering of prover suggestions and summaries
 */

#include "proofrank/report.hpp"

#include "proofrank/version.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <print>
#include <string>
#include <utility>

namespace proofrank::report {

namespace {

[[nodiscard]] nlohmann::json tool_json()
{
    return {
        {    "name", "proofrank"        },
        { "version", proofrank::kVersion},
        {"build_id", proofrank::kBuildId}
    };
}

[[nodiscard]] std::size_t prover_column_width(const heuristics::FileData& file)
{
    std::size_t width = 0;
    for (const auto& prover : file.provers) {
        width = std::max(width, prover.prover.size());
    }
    return width;
}

[[nodiscard]] std::string format_seconds(double seconds)
{
    return std::format("{:.2f}s", seconds);
}

[[nodiscard]] proofrank::VoidResult write_lines(const std::filesystem::path& path,
                                                const std::vector<std::string>& lines)
{
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            proofrank::Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    for (const auto& line : lines) {
        out << line << "\n";
    }
    if (!out) {
        return std::unexpected(
            proofrank::Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace

proofrank::Result<OutputFormat> parse_output_format(std::string_view text)
{
    if (text == "text") {
        return OutputFormat::kText;
    }
    if (text == "json") {
        return OutputFormat::kJson;
    }
    return std::unexpected(proofrank::Error::make(
        "InvalidArgument", std::format("Invalid --format value: {} (expected text or json)", text)));
}

nlohmann::json suggestion_to_json(const std::vector<heuristics::FileData>& files)
{
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& file : files) {
        nlohmann::json provers = nlohmann::json::array();
        for (const auto& prover : file.provers) {
            provers.push_back({
                {     "prover",              prover.prover},
                {    "success",     prover.timing.success},
                {     "failed",      prover.timing.failed},
                {"max_success", prover.timing.max_success},
                {  "max_steps",   prover.timing.max_steps}
            });
        }
        entries.push_back({
            {   "name", file.name},
            {"provers",   provers}
        });
    }
    return {
        {"schema_version", proofrank::kOutputSchemaVersion},
        {          "tool",                     tool_json()},
        {         "files",                         entries}
    };
}

std::vector<std::string> render_suggestion_text(const std::vector<heuristics::FileData>& files)
{
    std::vector<std::string> lines;
    for (const auto& file : files) {
        lines.push_back(file.name);
        const auto width = prover_column_width(file);
        for (const auto& prover : file.provers) {
            lines.push_back(std::format("  {:<{}}  success {:>9}  failed {:>9}  max {:>9}  steps {}",
                                        prover.prover,
                                        width,
                                        format_seconds(prover.timing.success),
                                        format_seconds(prover.timing.failed),
                                        format_seconds(prover.timing.max_success),
                                        prover.timing.max_steps));
        }
    }
    return lines;
}

nlohmann::json summary_to_json(const std::vector<summary::FileSummary>& files)
{
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& file : files) {
        entries.push_back({
            {       "name",        file.name},
            {   "entities",    file.entities},
            {"proof_items", file.proof_items},
            {   "unproved",    file.unproved},
            { "total_time",  file.total_time},
            {"max_success", file.max_success}
        });
    }
    return {
        {"schema_version", proofrank::kOutputSchemaVersion},
        {          "tool",                     tool_json()},
        {         "files",                         entries}
    };
}

std::vector<std::string> render_summary_text(const std::vector<summary::FileSummary>& files)
{
    std::size_t width = 0;
    for (const auto& file : files) {
        width = std::max(width, file.name.size());
    }

    std::vector<std::string> lines;
    lines.reserve(files.size());
    for (const auto& file : files) {
        lines.push_back(
            std::format("{:<{}}  entities {:>4}  checks {:>5}  unproved {:>4}  time {:>9}  max {:>9}",
                        file.name,
                        width,
                        file.entities,
                        file.proof_items,
                        file.unproved,
                        format_seconds(file.total_time),
                        format_seconds(file.max_success)));
    }
    return lines;
}

RenderedReport render_suggestion(const std::vector<heuristics::FileData>& files,
                                 OutputFormat format)
{
    RenderedReport report{.format = format,
                          .summary = std::format("files with prover suggestions: {}", files.size()),
                          .json = nullptr,
                          .text = {}};
    if (format == OutputFormat::kJson) {
        report.json = suggestion_to_json(files);
    } else {
        report.text = render_suggestion_text(files);
    }
    return report;
}

RenderedReport render_summary(const std::vector<summary::FileSummary>& files, OutputFormat format)
{
    RenderedReport report{.format = format,
                          .summary = std::format("files summarized: {}", files.size()),
                          .json = nullptr,
                          .text = {}};
    if (format == OutputFormat::kJson) {
        report.json = summary_to_json(files);
    } else {
        report.text = render_summary_text(files);
    }
    return report;
}

proofrank::VoidResult write_report(const RenderedReport& report,
                                   const std::optional<std::filesystem::path>& output_path)
{
    std::vector<std::string> lines = report.text;
    if (report.format == OutputFormat::kJson) {
        lines = {report.json.dump(2)};
    }

    if (output_path) {
        return write_lines(*output_path, lines);
    }
    for (const auto& line : lines) {
        std::println("{}", line);
    }
    return {};
}

}  // namespace proofrank::report
