/**
 * @file rank.cpp
 * @brief Prover ordering per file
 */

#include "proofrank/heuristics.hpp"

#include <algorithm>
#include <ranges>
#include <utility>
#include <vector>

namespace proofrank::heuristics {

bool rank_better(const ProverData& lhs, const ProverData& rhs) noexcept
{
    if (lhs.timing.failed != rhs.timing.failed) {
        return lhs.timing.failed < rhs.timing.failed;
    }
    // Equal wasted time: the prover that proved more goes first.
    return lhs.timing.success > rhs.timing.success;
}

std::vector<FileData> rank_provers(const TimingTable& table)
{
    std::vector<FileData> files;
    files.reserve(table.size());

    for (const auto& [file, timings] : table) {
        FileData data{.name = timings.source_name, .provers = {}};
        for (const auto& [prover, timing] : timings.provers) {
            if (prover == kTrivialProver) {
                continue;
            }
            data.provers.push_back(ProverData{.prover = prover, .timing = timing});
        }
        if (data.provers.empty()) {
            continue;
        }
        std::ranges::stable_sort(data.provers, rank_better);
        files.push_back(std::move(data));
    }

    std::ranges::stable_sort(files, [](const FileData& lhs, const FileData& rhs) {
        return lhs.name < rhs.name;
    });
    return files;
}

std::vector<FileData> find_optimum(const tree::ProofTree& tree)
{
    return rank_provers(aggregate_timings(tree));
}

}  // namespace proofrank::heuristics
