#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "trophdiv/core/Tables.hpp"

namespace trophdiv {

struct ExampleData {
  AbundanceTable abundances;
  TrophicLevels trophic_levels;
};

// Demonstration data set: 4 communities x 6 species.
// The 24 cells are a shuffle of 15 rounded U(0,100) abundances, 8 zeros and
// one missing value, filled column by column. Trophic levels are U(2,4.5)
// rounded to one decimal.
inline ExampleData make_example(std::uint64_t seed) {
  constexpr std::size_t kCommunities = 4;
  constexpr std::size_t kSpecies = 6;

  std::mt19937_64 rng(seed);
  std::uniform_real_distribution<double> abundance(0.0, 100.0);
  std::uniform_real_distribution<double> level(2.0, 4.5);

  std::vector<double> pool;
  pool.reserve(kCommunities * kSpecies);
  for (int i = 0; i < 15; ++i) pool.push_back(std::nearbyint(abundance(rng)));
  for (int i = 0; i < 8; ++i) pool.push_back(0.0);
  pool.push_back(kMissing);
  std::shuffle(pool.begin(), pool.end(), rng);

  std::vector<double> values(kCommunities * kSpecies);
  for (std::size_t j = 0; j < kSpecies; ++j) {
    for (std::size_t i = 0; i < kCommunities; ++i) {
      values[i * kSpecies + j] = pool[j * kCommunities + i];
    }
  }

  std::vector<std::string> communities;
  for (std::size_t i = 0; i < kCommunities; ++i) communities.push_back("com" + std::to_string(i + 1));

  ExampleData ex;
  for (std::size_t j = 0; j < kSpecies; ++j) {
    ex.trophic_levels.species.push_back("sp" + std::to_string(j + 1));
    ex.trophic_levels.levels.push_back(std::nearbyint(level(rng) * 10.0) / 10.0);
  }
  ex.abundances = AbundanceTable(std::move(communities), ex.trophic_levels.species, std::move(values));
  return ex;
}

} // namespace trophdiv
