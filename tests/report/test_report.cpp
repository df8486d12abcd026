/**
 * @file test_report.cpp
 * @brief Tests for suggestion and summary rendering
 */

#include "proofrank/report.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>

namespace {

using proofrank::heuristics::FileData;
using proofrank::heuristics::ProverData;
using proofrank::heuristics::Timing;
using proofrank::report::OutputFormat;

std::vector<FileData> make_suggestion()
{
    return {
        FileData{.name = "pkg.ads",
                 .provers = {ProverData{.prover = "CVC4",
                                        .timing = Timing{.success = 2.0,
                                                         .failed = 0.0,
                                                         .max_success = 2.0,
                                                         .max_steps = 1}},
                             ProverData{.prover = "Z3",
                                        .timing = Timing{.success = 0.0,
                                                         .failed = 5.0,
                                                         .max_success = 0.0,
                                                         .max_steps = 0}}}},
    };
}

std::vector<proofrank::summary::FileSummary> make_summary()
{
    return {
        proofrank::summary::FileSummary{.name = "pkg.ads",
                                        .entities = 2,
                                        .proof_items = 3,
                                        .unproved = 1,
                                        .total_time = 7.0,
                                        .max_success = 2.0},
    };
}

}  // namespace

TEST(ReportSuggestion, JsonListsFilesAndProversInOrder)
{
    const auto payload = proofrank::report::suggestion_to_json(make_suggestion());
    EXPECT_EQ(payload.at("schema_version"), "proofrank.v1");
    EXPECT_EQ(payload.at("tool").at("name"), "proofrank");

    const auto& files = payload.at("files");
    ASSERT_EQ(files.size(), 1U);
    EXPECT_EQ(files.at(0).at("name"), "pkg.ads");
    const auto& provers = files.at(0).at("provers");
    ASSERT_EQ(provers.size(), 2U);
    EXPECT_EQ(provers.at(0).at("prover"), "CVC4");
    EXPECT_DOUBLE_EQ(provers.at(0).at("success").get<double>(), 2.0);
    EXPECT_DOUBLE_EQ(provers.at(0).at("failed").get<double>(), 0.0);
    EXPECT_DOUBLE_EQ(provers.at(0).at("max_success").get<double>(), 2.0);
    EXPECT_EQ(provers.at(0).at("max_steps").get<std::uint64_t>(), 1U);
    EXPECT_EQ(provers.at(1).at("prover"), "Z3");
    EXPECT_DOUBLE_EQ(provers.at(1).at("failed").get<double>(), 5.0);
}

TEST(ReportSuggestion, TextHasFileHeaderAndIndentedProvers)
{
    const auto lines = proofrank::report::render_suggestion_text(make_suggestion());
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_EQ(lines[0], "pkg.ads");
    EXPECT_EQ(lines[1], "  CVC4  success     2.00s  failed     0.00s  max     2.00s  steps 1");
    EXPECT_EQ(lines[2], "  Z3    success     0.00s  failed     5.00s  max     0.00s  steps 0");
}

TEST(ReportSuggestion, EmptyInputRendersEmptyDocument)
{
    const auto rendered = proofrank::report::render_suggestion({}, OutputFormat::kJson);
    EXPECT_EQ(rendered.format, OutputFormat::kJson);
    EXPECT_TRUE(rendered.json.at("files").empty());
    EXPECT_EQ(rendered.summary, "files with prover suggestions: 0");
}

TEST(ReportSummary, TextAndJson)
{
    const auto lines = proofrank::report::render_summary_text(make_summary());
    ASSERT_EQ(lines.size(), 1U);
    EXPECT_EQ(lines[0],
              "pkg.ads  entities    2  checks     3  unproved    1  time     7.00s  max     2.00s");

    const auto payload = proofrank::report::summary_to_json(make_summary());
    const auto& file = payload.at("files").at(0);
    EXPECT_EQ(file.at("name"), "pkg.ads");
    EXPECT_EQ(file.at("entities"), 2);
    EXPECT_EQ(file.at("proof_items"), 3);
    EXPECT_EQ(file.at("unproved"), 1);
    EXPECT_DOUBLE_EQ(file.at("total_time").get<double>(), 7.0);
}

TEST(ReportOutput, ParsesFormat)
{
    EXPECT_EQ(proofrank::report::parse_output_format("text").value(), OutputFormat::kText);
    EXPECT_EQ(proofrank::report::parse_output_format("json").value(), OutputFormat::kJson);
    auto invalid = proofrank::report::parse_output_format("html");
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code, "InvalidArgument");
}

TEST(ReportOutput, WritesRenderedReportToFile)
{
    const auto path = std::filesystem::temp_directory_path() / "proofrank_test_report.json";
    const auto rendered = proofrank::report::render_suggestion(make_suggestion(), OutputFormat::kJson);
    ASSERT_TRUE(proofrank::report::write_report(rendered, path).has_value());

    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    EXPECT_EQ(nlohmann::json::parse(buffer.str()), rendered.json);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(ReportOutput, UnwritablePathIsAnError)
{
    const auto rendered = proofrank::report::render_summary(make_summary(), OutputFormat::kText);
    auto written = proofrank::report::write_report(
        rendered, std::filesystem::path("/nonexistent/dir/summary.txt"));
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, "IOError");
}
