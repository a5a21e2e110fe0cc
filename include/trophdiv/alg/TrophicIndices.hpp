#pragma once

#include <optional>
#include <span>

#include "trophdiv/core/Tables.hpp"

namespace trophdiv::alg {

// Round to 3 decimals, ties to even (default FP rounding mode).
double round3(double x);

// Indices of one community following Villeger et al. (2008).
//
// `abundances` and `levels` are parallel over all species of the table.
// Only species with abundance > 0 take part; zero and missing (NaN)
// abundances are skipped entirely.
// Returns nullopt when no species is present.
std::optional<CommunityIndices> compute_community(std::span<const double> abundances,
                                                  std::span<const double> levels);

// FROm evenness over species already restricted to those present.
// Returns nullopt with fewer than 3 distinct trophic levels.
std::optional<double> trophic_evenness(std::span<const double> present_abundances,
                                       std::span<const double> present_levels);

} // namespace trophdiv::alg
