/**
 * @file normalize.cpp
 * @brief Prover-specific step normalization and source name resolution
 */

#include "proofrank/common.hpp"
#include "proofrank/heuristics.hpp"

#include <limits>
#include <string>

namespace proofrank::heuristics {

namespace {

struct StepScale
{
    std::string_view prefix;
    Steps offset;
    Steps divisor;
};

// Inverse of the per-prover scaling applied to the --steps limit.
constexpr StepScale kCvc4Scale{.prefix = "CVC4", .offset = 15'000, .divisor = 35};
constexpr StepScale kZ3Scale{.prefix = "Z3", .offset = 450'000, .divisor = 800};

[[nodiscard]] constexpr Steps scale(const StepScale& factor, Steps raw) noexcept
{
    const Steps above = raw > factor.offset ? raw - factor.offset : 0;
    return above / factor.divisor + 1;
}

}  // namespace

Steps normalize_steps(std::string_view prover, Steps raw) noexcept
{
    if (prover.starts_with(kCvc4Scale.prefix)) {
        return scale(kCvc4Scale, raw);
    }
    if (prover.starts_with(kZ3Scale.prefix)) {
        return scale(kZ3Scale, raw);
    }
    // Saturate so the largest raw count still reads as "ran".
    return raw == std::numeric_limits<Steps>::max() ? raw : raw + 1;
}

bool is_spec_file(std::string_view name) noexcept
{
    return common::iequals(common::file_extension(name), "ads");
}

std::string resolve_source_name(std::string_view current, std::string_view candidate)
{
    if (current.empty()) {
        return std::string(candidate);
    }
    if (candidate.size() < current.size()) {
        return std::string(candidate);
    }
    if (is_spec_file(candidate)) {
        return std::string(candidate);
    }
    return std::string(current);
}

}  // namespace proofrank::heuristics
