#include "trophdiv/alg/TrophicIndices.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numbers>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace trophdiv::alg {

double round3(double x) {
  const double r = std::nearbyint(x * 1000.0) / 1000.0;
  return r == 0.0 ? 0.0 : r; // no negative zero in the output
}

std::optional<double> trophic_evenness(std::span<const double> present_abundances,
                                       std::span<const double> present_levels) {
  if (present_abundances.size() != present_levels.size()) {
    throw std::invalid_argument("trophic_evenness: abundance/level size mismatch");
  }

  std::vector<double> distinct(present_levels.begin(), present_levels.end());
  std::sort(distinct.begin(), distinct.end());
  distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
  if (distinct.size() <= 2) return std::nullopt;

  const std::size_t s = present_levels.size();

  // Ties keep their input order.
  std::vector<std::size_t> order(s);
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return present_levels[a] < present_levels[b];
  });

  double abtot = 0.0;
  for (double a : present_abundances) abtot += a;

  std::vector<double> to(s);
  std::vector<double> bo(s);
  for (std::size_t i = 0; i < s; ++i) {
    to[i] = present_levels[order[i]];
    bo[i] = present_abundances[order[i]] / abtot;
  }

  const double os = 1.0 / static_cast<double>(s - 1);

  std::vector<double> ew(s - 1);
  double ew_sum = 0.0;
  for (std::size_t j = 0; j + 1 < s; ++j) {
    ew[j] = std::fabs(to[j + 1] - to[j]) / (bo[j + 1] + bo[j]);
    ew_sum += ew[j];
  }

  double min_pew_sum = 0.0;
  for (std::size_t j = 0; j + 1 < s; ++j) {
    min_pew_sum += std::min(ew[j] / ew_sum, os);
  }

  return round3((min_pew_sum - os) / (1.0 - os));
}

std::optional<CommunityIndices> compute_community(std::span<const double> abundances,
                                                  std::span<const double> levels) {
  if (abundances.size() != levels.size()) {
    throw std::invalid_argument("compute_community: abundance/level size mismatch");
  }

  // Present species: strictly positive abundance. NaN fails the comparison.
  std::vector<double> a;
  std::vector<double> t;
  for (std::size_t j = 0; j < abundances.size(); ++j) {
    if (abundances[j] > 0.0) {
      a.push_back(abundances[j]);
      t.push_back(levels[j]);
    }
  }
  if (a.empty()) return std::nullopt;

  CommunityIndices ci;

  for (double x : a) ci.abtot += x;
  ci.nbsp = a.size();

  {
    std::vector<double> distinct = t;
    std::sort(distinct.begin(), distinct.end());
    distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
    ci.nbtl = distinct.size();
  }

  const auto [mn, mx] = std::minmax_element(t.begin(), t.end());
  ci.mintl = *mn;
  ci.maxtl = *mx;
  ci.rgetl = ci.maxtl - ci.mintl;

  std::vector<double> r(a.size());
  for (std::size_t i = 0; i < a.size(); ++i) r[i] = a[i] / ci.abtot;

  double m1 = 0.0;
  double m2 = 0.0;
  double lm1 = 0.0;
  double lm2 = 0.0;
  for (std::size_t i = 0; i < t.size(); ++i) {
    const double lt = std::log(t[i]);
    m1 += t[i] * r[i];
    m2 += t[i] * t[i] * r[i];
    lm1 += lt * r[i];
    lm2 += lt * lt * r[i];
  }

  ci.meantl = round3(m1);

  // The rounded mean enters the variance; rounding error may push it below zero.
  const double radicand = m2 - ci.meantl * ci.meantl;
  ci.sdtl = round3(std::sqrt(std::max(radicand, 0.0)));

  const double v = std::max(lm2 - lm1 * lm1, 0.0);
  ci.FDvar = round3(2.0 / std::numbers::pi * std::atan(5.0 * v));

  if (ci.nbtl > 2) {
    ci.FROm = trophic_evenness(a, t);
  }

  return ci;
}

} // namespace trophdiv::alg
