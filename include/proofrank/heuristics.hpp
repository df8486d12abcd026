#pragma once

/**
 * @file heuristics.hpp
 * @brief Per-file prover timing aggregation and prover ordering heuristics
 *
 * The ranking only reflects provers that were actually invoked. Provers that
 * were skipped because an earlier one already discharged a check are unseen,
 * so the suggested order is an approximation, not an optimum.
 */

#include "proofrank/proof_tree.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace proofrank::heuristics {

using Steps = std::uint64_t;

/// Pseudo-prover for checks discharged without real proving effort
constexpr std::string_view kTrivialProver = "Trivial";

/**
 * @brief Accumulated timings of one prover within one file
 */
struct Timing
{
    double success = 0.0;      ///< Total time of Valid attempts
    double failed = 0.0;       ///< Total time of all other attempts
    double max_success = 0.0;  ///< Longest single Valid attempt
    Steps max_steps = 0;       ///< Largest normalized step count of a Valid attempt
};

struct FileTimings
{
    std::string source_name;                ///< Representative source file name
    std::map<std::string, Timing> provers;  ///< Keyed by prover name
};

/// Keyed by file key (the report file an entity was read from)
using TimingTable = std::map<std::string, FileTimings>;

struct ProverData
{
    std::string prover;
    Timing timing;
};

struct FileData
{
    std::string name;
    std::vector<ProverData> provers;
};

/**
 * Rescale a raw step count onto a roughly prover-independent scale.
 * The result is at least 1 so a reported 0 is distinguishable from "never ran".
 */
[[nodiscard]] Steps normalize_steps(std::string_view prover, Steps raw) noexcept;

/// True if the file name carries a specification extension (ads, any case)
[[nodiscard]] bool is_spec_file(std::string_view name) noexcept;

/**
 * Fold step for choosing a representative name among candidate spellings.
 *
 * An empty current adopts the candidate. Otherwise a strictly shorter
 * candidate wins, and failing that a spec candidate wins. Only the candidate
 * is inspected, so a shorter body name can displace an adopted spec name.
 */
[[nodiscard]] std::string resolve_source_name(std::string_view current,
                                              std::string_view candidate);

/// Get-or-insert the zero-initialized accumulator for (file, prover)
[[nodiscard]] Timing& timing_for(TimingTable& table,
                                 const std::string& file,
                                 const std::string& prover);

/// One pass over the tree accumulating timings per (file, prover)
[[nodiscard]] TimingTable aggregate_timings(const tree::ProofTree& tree);

/// Less failed time first; on equal failed time, more success time first
[[nodiscard]] bool rank_better(const ProverData& lhs, const ProverData& rhs) noexcept;

/// Drop Trivial and empty files, order provers per file and files by name
[[nodiscard]] std::vector<FileData> rank_provers(const TimingTable& table);

/// aggregate_timings followed by rank_provers
[[nodiscard]] std::vector<FileData> find_optimum(const tree::ProofTree& tree);

}  // namespace proofrank::heuristics
