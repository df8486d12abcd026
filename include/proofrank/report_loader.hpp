#pragma once

/**
 * @file report_loader.hpp
 * @brief Load gnatprove `.spark` reports into a proof tree
 */

#include "proofrank/common.hpp"
#include "proofrank/proof_tree.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace proofrank::loader {

/// Extension of the report files produced by gnatprove
constexpr std::string_view kReportExtension = ".spark";

/**
 * File key of a report: its path relative to root, without the extension,
 * using '/' separators. Falls back to the file stem when path is not below root.
 */
[[nodiscard]] std::string report_key(const std::filesystem::path& path,
                                     const std::filesystem::path& root);

class ReportLoader
{
public:
    explicit ReportLoader(std::string schema_dir = "schemas");

    /**
     * @brief Read, validate and append one report file to the tree
     *
     * The report's file stem becomes the file key of every entity it contributes.
     * Nothing is appended when the file fails to open, parse or validate.
     */
    [[nodiscard]] proofrank::VoidResult load_file(const std::filesystem::path& path,
                                                  tree::ProofTree& tree) const;

    /// As above, keyed by report_key(path, root) so equal stems in different
    /// directories stay apart
    [[nodiscard]] proofrank::VoidResult load_file(const std::filesystem::path& path,
                                                  const std::filesystem::path& root,
                                                  tree::ProofTree& tree) const;

    /**
     * @brief Validate and append an already-parsed report document
     * @param report Parsed `.spark` document, object keys in document order
     * @param report_file File key assigned to the report's entities
     * @param tree Tree to append to
     */
    [[nodiscard]] proofrank::VoidResult load_json(const nlohmann::ordered_json& report,
                                                  const std::string& report_file,
                                                  tree::ProofTree& tree) const;

private:
    std::string m_schema_dir;
};

}  // namespace proofrank::loader
