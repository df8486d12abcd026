#include "proofrank/report.hpp"
#include "proofrank/schema_validate.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace proofrank::common::test {

namespace {

std::string schema_path(const std::string& name)
{
    return std::string(PROOFRANK_SCHEMA_DIR) + "/" + name;
}

nlohmann::json make_spark_report_json()
{
    return nlohmann::json{
        {"spark", nlohmann::json::array({{{"name", "Pkg"}, {"sloc", {{{"file", "pkg.ads"}, {"line", 1}}}}}})},
        {"proof",
         nlohmann::json::array({{{"file", "pkg.adb"},
                                 {"line", 4},
                                 {"col", 9},
                                 {"rule", "VC_DIVISION_CHECK"},
                                 {"severity", "medium"},
                                 {"entity", {{"name", "Pkg.Div"}}},
                                 {"check_tree",
                                  nlohmann::json::array({{{"proof_attempts",
                                                           {{"Z3",
                                                             {{"result", "Valid"},
                                                              {"time", 0.1},
                                                              {"steps", 3}}}}}}})}}})}
    };
}

nlohmann::json make_suggestion_json()
{
    return report::suggestion_to_json({
        heuristics::FileData{
                             .name = "pkg.ads",
                             .provers = {heuristics::ProverData{.prover = "Z3",
                                                               .timing = heuristics::Timing{.success = 0.1,
                                                                                            .failed = 0.0,
                                                                                            .max_success = 0.1,
                                                                                            .max_steps = 1}}}},
    });
}

nlohmann::json make_summary_json()
{
    return report::summary_to_json({
        summary::FileSummary{.name = "pkg.ads",
                             .entities = 1,
                             .proof_items = 1,
                             .unproved = 0,
                             .total_time = 0.1,
                             .max_success = 0.1},
    });
}

struct SchemaCase
{
    std::string schema_file;
    nlohmann::json valid_json;
    nlohmann::json::json_pointer breaking_field;
};

std::vector<SchemaCase> make_schema_cases()
{
    using ptr = nlohmann::json::json_pointer;
    return {
        {.schema_file = "spark_report.v1.schema.json",
         .valid_json = make_spark_report_json(),
         .breaking_field = ptr("/proof/0/check_tree/0/proof_attempts/Z3/steps")},
        {.schema_file = "proofrank.v1.schema.json",
         .valid_json = make_suggestion_json(),
         .breaking_field = ptr("/files/0/provers/0/failed")},
        {.schema_file = "proofrank.v1.schema.json",
         .valid_json = make_summary_json(),
         .breaking_field = ptr("/files/0/unproved")},
    };
}

}  // namespace

TEST(SchemaValidateTest, ValidSamplesPass)
{
    for (const auto& schema_case : make_schema_cases()) {
        SCOPED_TRACE(schema_case.schema_file);
        auto result = validate_json(schema_case.valid_json, schema_path(schema_case.schema_file));

        EXPECT_TRUE(result) << result.error().message;
    }
}

TEST(SchemaValidateTest, InvalidSamplesFail)
{
    for (const auto& schema_case : make_schema_cases()) {
        SCOPED_TRACE(schema_case.schema_file);
        nlohmann::json invalid = schema_case.valid_json;
        invalid[schema_case.breaking_field] = "not a number";

        auto result = validate_json(invalid, schema_path(schema_case.schema_file));

        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().code, "SchemaValidationFailed");
        EXPECT_FALSE(result.error().message.empty());
    }
}

TEST(SchemaValidateTest, OutputRejectsForeignSchemaVersion)
{
    auto invalid = make_suggestion_json();
    invalid["schema_version"] = "proofrank.v0";

    auto result = validate_json(invalid, schema_path("proofrank.v1.schema.json"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(SchemaValidateTest, MissingSchemaFile)
{
    auto result = validate_json(make_summary_json(), schema_path("absent.v1.schema.json"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

TEST(SchemaValidateTest, MalformedSchemaFile)
{
    const auto path = std::filesystem::temp_directory_path() / "proofrank_broken.schema.json";
    {
        std::ofstream out(path);
        out << "{ \"type\": ";
    }

    auto result = validate_json(make_summary_json(), path);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaParseFailed");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace proofrank::common::test
