#include "trophdiv/engine/IndexEngine.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>

#if TROPHDIV_HAS_OPENMP
#include <omp.h>
#endif

#include "trophdiv/alg/TrophicIndices.hpp"

namespace trophdiv {

void IndexEngine::validate(const AbundanceTable& ab, const TrophicLevels& tl) {
  const std::size_t S = ab.n_species();

  if (tl.size() != S) {
    throw InputError(ErrorKind::DimensionMismatch,
                     "number of species differs: abundance table has " + std::to_string(S) +
                         " columns, trophic levels has " + std::to_string(tl.size()) + " entries");
  }
  if (tl.species.size() != tl.levels.size()) {
    throw InputError(ErrorKind::DimensionMismatch,
                     "trophic levels carry " + std::to_string(tl.species.size()) + " species names for " +
                         std::to_string(tl.levels.size()) + " values");
  }

  for (std::size_t j = 0; j < S; ++j) {
    if (is_missing(tl.levels[j])) {
      throw InputError(ErrorKind::InvalidInput,
                       "missing trophic level for species '" + tl.species[j] + "' (position " +
                           std::to_string(j + 1) + ")");
    }
  }

  const auto& cols = ab.species();
  for (std::size_t j = 0; j < S; ++j) {
    if (cols[j] != tl.species[j]) {
      throw InputError(ErrorKind::NameMismatch,
                       "species names differ at position " + std::to_string(j + 1) +
                           ": abundance table has '" + cols[j] + "', trophic levels has '" +
                           tl.species[j] + "'");
    }
  }
}

ResultTable IndexEngine::compute(const AbundanceTable& ab, const TrophicLevels& tl) const {
  validate(ab, tl);

  const std::size_t C = ab.n_communities();
  const std::span<const double> levels(tl.levels);

  ResultTable out;
  out.rows.resize(C);

  // Each iteration writes only its own row.
#if TROPHDIV_HAS_OPENMP
  #pragma omp parallel for schedule(dynamic, 16)
  for (std::int64_t kk = 0; kk < static_cast<std::int64_t>(C); ++kk) {
    const std::size_t k = static_cast<std::size_t>(kk);
    out.rows[k].label = ab.communities()[k];
    out.rows[k].indices = alg::compute_community(ab.row(k), levels);
  }
#else
  for (std::size_t k = 0; k < C; ++k) {
    out.rows[k].label = ab.communities()[k];
    out.rows[k].indices = alg::compute_community(ab.row(k), levels);
  }
#endif

  // Warnings are collected after the loop so their order is deterministic.
  for (std::size_t k = 0; k < C; ++k) {
    if (out.rows[k].indices) continue;
    RowWarning w;
    w.row = k;
    w.community = out.rows[k].label;
    w.message = "NoSpeciesPresent: community '" + w.community + "' (row " + std::to_string(k + 1) +
                ") has no species with positive abundance; all indices undefined";
    if (log_warnings_) {
      std::cerr << "[TROPHDIV] warning: " << w.message << "\n";
    }
    out.warnings.push_back(std::move(w));
  }

  return out;
}

} // namespace trophdiv
