#pragma once

/**
 * @file report.hpp
 * @brief Text and JSON rendering of prover suggestions and summaries
 */

#include "proofrank/common.hpp"
#include "proofrank/heuristics.hpp"
#include "proofrank/summary.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace proofrank::report {

enum class OutputFormat { kText, kJson };

[[nodiscard]] proofrank::Result<OutputFormat> parse_output_format(std::string_view text);

struct RenderedReport
{
    OutputFormat format;
    std::string summary;            ///< One-line status for the console
    nlohmann::json json;            ///< Set for kJson
    std::vector<std::string> text;  ///< Set for kText
};

[[nodiscard]] nlohmann::json suggestion_to_json(const std::vector<heuristics::FileData>& files);
[[nodiscard]] std::vector<std::string>
render_suggestion_text(const std::vector<heuristics::FileData>& files);

[[nodiscard]] nlohmann::json summary_to_json(const std::vector<summary::FileSummary>& files);
[[nodiscard]] std::vector<std::string>
render_summary_text(const std::vector<summary::FileSummary>& files);

[[nodiscard]] RenderedReport render_suggestion(const std::vector<heuristics::FileData>& files,
                                               OutputFormat format);
[[nodiscard]] RenderedReport render_summary(const std::vector<summary::FileSummary>& files,
                                            OutputFormat format);

/**
 * Write a rendered report to output_path, or to stdout when no path is given.
 */
[[nodiscard]] proofrank::VoidResult
write_report(const RenderedReport& report,
             const std::optional<std::filesystem::path>& output_path);

}  // namespace proofrank::report
