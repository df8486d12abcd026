#pragma once

/**
 * @file summary.hpp
 * @brief Per-file proof effort summary
 */

#include "proofrank/proof_tree.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace proofrank::summary {

struct FileSummary
{
    std::string name;  ///< Representative source file name
    std::size_t entities = 0;
    std::size_t proof_items = 0;
    std::size_t unproved = 0;  ///< Proof items without any Valid attempt
    double total_time = 0.0;   ///< Sum of all attempt times
    double max_success = 0.0;  ///< Longest single Valid attempt
};

/**
 * Summarize a proof tree per file key, ordered by representative name.
 * Files without proof items are listed with zero counts.
 */
[[nodiscard]] std::vector<FileSummary> summarize(const tree::ProofTree& tree);

}  // namespace proofrank::summary
