/**
 * @file report_loader.cpp
 * @brief gnatprove `.spark` report loading
 */

#include "proofrank/report_loader.hpp"

#include "proofrank/heuristics.hpp"
#include "proofrank/schema_validate.hpp"
#include "proofrank/version.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <fstream>
#include <map>
#include <string>
#include <utility>

namespace proofrank::loader {

namespace {

using EntityIndex = std::map<std::string, tree::NodeIndex>;

[[nodiscard]] proofrank::Result<nlohmann::ordered_json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            proofrank::Error::make("IOError", "Failed to open report file: " + path.string()));
    }
    nlohmann::ordered_json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(proofrank::Error::make(
            "ParseError", "Failed to parse report file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

[[nodiscard]] tree::NodeIndex entity_for(tree::ProofTree& tree,
                                         EntityIndex& entities,
                                         const std::string& name,
                                         const std::string& report_file)
{
    if (auto it = entities.find(name); it != entities.end()) {
        return it->second;
    }
    const auto index = tree.add_entity(tree::Entity{.name = name, .report_file = report_file});
    entities.emplace(name, index);
    return index;
}

[[nodiscard]] std::uint64_t parse_steps(const nlohmann::ordered_json& steps)
{
    if (steps.is_number_unsigned()) {
        return steps.get<std::uint64_t>();
    }
    // Some provers report negative values for unavailable measurements.
    return static_cast<std::uint64_t>(std::max<std::int64_t>(steps.get<std::int64_t>(), 0));
}

[[nodiscard]] tree::Attempt parse_attempt(const std::string& prover,
                                          const nlohmann::ordered_json& attempt)
{
    return tree::Attempt{
        .prover = prover,
        .outcome = tree::parse_outcome(attempt.at("result").get_ref<const std::string&>()),
        .time = std::max(attempt.at("time").get<double>(), 0.0),
        .steps = parse_steps(attempt.at("steps")),
    };
}

[[nodiscard]] proofrank::VoidResult add_attempts(tree::ProofTree& tree,
                                                 tree::NodeIndex item,
                                                 const nlohmann::ordered_json& proof)
{
    bool any_attempt = false;
    if (const auto check_tree = proof.find("check_tree"); check_tree != proof.end()) {
        for (const auto& path : *check_tree) {
            const auto attempts = path.find("proof_attempts");
            if (attempts == path.end()) {
                continue;
            }
            // Object order is invocation order.
            for (const auto& [prover, attempt] : attempts->items()) {
                auto added = tree.add_attempt(item, parse_attempt(prover, attempt));
                if (!added) {
                    return std::unexpected(added.error());
                }
                any_attempt = true;
            }
        }
    }

    if (!any_attempt) {
        // Discharged by gnatprove without calling a prover.
        auto added = tree.add_attempt(item,
                                      tree::Attempt{
                                          .prover = std::string(heuristics::kTrivialProver),
                                          .outcome = tree::Outcome::kValid,
                                          .time = 0.0,
                                          .steps = 0,
                                      });
        if (!added) {
            return std::unexpected(added.error());
        }
    }
    return {};
}

}  // namespace

ReportLoader::ReportLoader(std::string schema_dir)
    : m_schema_dir(std::move(schema_dir))
{}

std::string report_key(const std::filesystem::path& path, const std::filesystem::path& root)
{
    auto relative = path.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        return path.stem().string();
    }
    relative.replace_extension();
    return relative.generic_string();
}

proofrank::VoidResult ReportLoader::load_file(const std::filesystem::path& path,
                                              tree::ProofTree& tree) const
{
    return load_file(path, path.parent_path(), tree);
}

proofrank::VoidResult ReportLoader::load_file(const std::filesystem::path& path,
                                              const std::filesystem::path& root,
                                              tree::ProofTree& tree) const
{
    auto report = read_json_file(path);
    if (!report) {
        return std::unexpected(report.error());
    }
    return load_json(*report, report_key(path, root), tree);
}

proofrank::VoidResult ReportLoader::load_json(const nlohmann::ordered_json& report,
                                              const std::string& report_file,
                                              tree::ProofTree& tree) const
{
    const auto schema_path = std::filesystem::path(m_schema_dir)
                             / (std::string(proofrank::kReportSchemaVersion) + ".schema.json");
    // The validator works on the sorted-key document type.
    if (auto validation = common::validate_json(nlohmann::json::parse(report.dump()), schema_path);
        !validation) {
        return std::unexpected(proofrank::Error::make(
            "SchemaInvalid",
            "report " + report_file + " failed schema validation: " + validation.error().message));
    }

    EntityIndex entities;
    if (const auto spark = report.find("spark"); spark != report.end()) {
        for (const auto& entity : *spark) {
            (void)entity_for(tree, entities, entity.at("name").get<std::string>(), report_file);
        }
    }

    const auto proofs = report.find("proof");
    if (proofs == report.end()) {
        return {};
    }
    for (const auto& proof : *proofs) {
        const auto entity = entity_for(tree,
                                       entities,
                                       proof.at("entity").at("name").get<std::string>(),
                                       report_file);
        auto item = tree.add_proof_item(entity,
                                        tree::ProofItem{
                                            .source_file = proof.at("file").get<std::string>(),
                                            .line = proof.at("line").get<int>(),
                                            .column = proof.at("col").get<int>(),
                                            .rule = proof.at("rule").get<std::string>(),
                                            .severity = proof.at("severity").get<std::string>(),
                                        });
        if (!item) {
            return std::unexpected(item.error());
        }
        if (auto added = add_attempts(tree, *item, proof); !added) {
            return std::unexpected(added.error());
        }
    }
    return {};
}

}  // namespace proofrank::loader
