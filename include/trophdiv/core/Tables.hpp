#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace trophdiv {

// Missing cells are stored as quiet NaN.
inline constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

inline bool is_missing(double x) { return std::isnan(x); }

// C x S abundance matrix (communities x species), row-major.
class AbundanceTable {
public:
  AbundanceTable() = default;

  AbundanceTable(std::vector<std::string> communities,
                 std::vector<std::string> species,
                 std::vector<double> values)
      : communities_(std::move(communities)),
        species_(std::move(species)),
        values_(std::move(values)) {
    if (values_.size() != communities_.size() * species_.size()) {
      throw std::runtime_error("AbundanceTable: value count " + std::to_string(values_.size()) +
                               " != " + std::to_string(communities_.size()) + " x " +
                               std::to_string(species_.size()));
    }
  }

  std::size_t n_communities() const { return communities_.size(); }
  std::size_t n_species() const { return species_.size(); }

  const std::vector<std::string>& communities() const { return communities_; }
  const std::vector<std::string>& species() const { return species_; }

  double at(std::size_t community, std::size_t species) const {
    return values_[community * species_.size() + species];
  }

  std::span<const double> row(std::size_t community) const {
    return std::span<const double>(values_.data() + community * species_.size(), species_.size());
  }

private:
  std::vector<std::string> communities_;
  std::vector<std::string> species_;
  std::vector<double> values_;
};

// One trophic level per species, keyed (and ordered) by species identifier.
struct TrophicLevels {
  std::vector<std::string> species;
  std::vector<double> levels;

  std::size_t size() const { return levels.size(); }
};

// The ten indices of one community.
struct CommunityIndices {
  double abtot = 0.0;
  std::size_t nbsp = 0;
  std::size_t nbtl = 0;
  double mintl = 0.0;
  double maxtl = 0.0;
  double rgetl = 0.0;
  double meantl = 0.0;
  double sdtl = 0.0;
  double FDvar = 0.0;
  std::optional<double> FROm; // defined only with at least 3 distinct trophic levels
};

inline constexpr std::array<const char*, 10> kIndexColumns = {
    "abtot", "nbsp", "nbtl", "mintl", "maxtl", "rgetl", "meantl", "sdtl", "FDvar", "FROm"};

// Cell value by column position (kIndexColumns order); nullopt when undefined.
inline std::optional<double> index_value(const CommunityIndices& ci, std::size_t column) {
  switch (column) {
    case 0: return ci.abtot;
    case 1: return static_cast<double>(ci.nbsp);
    case 2: return static_cast<double>(ci.nbtl);
    case 3: return ci.mintl;
    case 4: return ci.maxtl;
    case 5: return ci.rgetl;
    case 6: return ci.meantl;
    case 7: return ci.sdtl;
    case 8: return ci.FDvar;
    case 9: return ci.FROm;
  }
  throw std::out_of_range("index_value: column " + std::to_string(column));
}

struct CommunityRow {
  std::string label;
  // nullopt: no species present, the whole row is undefined.
  std::optional<CommunityIndices> indices;
};

struct RowWarning {
  std::size_t row = 0;
  std::string community;
  std::string message;
};

struct ResultTable {
  std::vector<CommunityRow> rows;
  std::vector<RowWarning> warnings;

  std::size_t size() const { return rows.size(); }

  const CommunityRow* find(const std::string& label) const {
    for (const auto& r : rows) {
      if (r.label == label) return &r;
    }
    return nullptr;
  }
};

} // namespace trophdiv
