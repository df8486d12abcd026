/**
 * @file aggregate.cpp
 * @brief Per-file, per-prover timing aggregation over a proof tree
 */

#include "proofrank/heuristics.hpp"

#include <algorithm>
#include <string>

namespace proofrank::heuristics {

namespace {

void accumulate(Timing& timing, const tree::Attempt& attempt)
{
    if (attempt.outcome == tree::Outcome::kValid) {
        timing.success += attempt.time;
        timing.max_success = std::max(timing.max_success, attempt.time);
        timing.max_steps =
            std::max(timing.max_steps, normalize_steps(attempt.prover, attempt.steps));
        return;
    }
    timing.failed += attempt.time;
}

}  // namespace

Timing& timing_for(TimingTable& table, const std::string& file, const std::string& prover)
{
    auto& provers = table.try_emplace(file).first->second.provers;
    return provers.try_emplace(prover).first->second;
}

TimingTable aggregate_timings(const tree::ProofTree& tree)
{
    TimingTable table;
    for (const auto entity_index : tree.entities()) {
        const auto& file = tree.entity(entity_index).report_file;
        for (const auto item_index : tree.children(entity_index)) {
            const auto& item = tree.proof_item(item_index);
            for (const auto attempt_index : tree.children(item_index)) {
                const auto& attempt = tree.attempt(attempt_index);
                accumulate(timing_for(table, file, attempt.prover), attempt);
            }

            auto& file_timings = table[file];
            file_timings.source_name =
                resolve_source_name(file_timings.source_name, item.source_file);
        }
    }
    return table;
}

}  // namespace proofrank::heuristics
