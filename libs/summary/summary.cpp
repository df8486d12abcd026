/**
 * @file summary.cpp
 * @brief Per-file proof effort summary
 */

#include "proofrank/summary.hpp"

#include "proofrank/heuristics.hpp"

#include <algorithm>
#include <map>
#include <ranges>
#include <utility>

namespace proofrank::summary {

std::vector<FileSummary> summarize(const tree::ProofTree& tree)
{
    std::map<std::string, FileSummary> by_file;

    for (const auto entity_index : tree.entities()) {
        auto& file = by_file[tree.entity(entity_index).report_file];
        ++file.entities;

        for (const auto item_index : tree.children(entity_index)) {
            const auto& item = tree.proof_item(item_index);
            file.name = heuristics::resolve_source_name(file.name, item.source_file);
            ++file.proof_items;

            bool proved = false;
            for (const auto attempt_index : tree.children(item_index)) {
                const auto& attempt = tree.attempt(attempt_index);
                file.total_time += attempt.time;
                if (attempt.outcome == tree::Outcome::kValid) {
                    proved = true;
                    file.max_success = std::max(file.max_success, attempt.time);
                }
            }
            if (!proved) {
                ++file.unproved;
            }
        }
    }

    std::vector<FileSummary> files;
    files.reserve(by_file.size());
    for (auto& [key, file] : by_file) {
        if (file.name.empty()) {
            // No proof item named a source file; fall back to the report name.
            file.name = key;
        }
        files.push_back(std::move(file));
    }
    std::ranges::stable_sort(files, [](const FileSummary& lhs, const FileSummary& rhs) {
        return lhs.name < rhs.name;
    });
    return files;
}

}  // namespace proofrank::summary
