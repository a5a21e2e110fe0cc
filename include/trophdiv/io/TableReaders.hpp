#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "trophdiv/core/Tables.hpp"

namespace trophdiv {
namespace fs = std::filesystem;

struct TableReadOptions {
  char separator = ',';
  // Cells equal to one of these tokens are read as missing (NaN).
  std::vector<std::string> missing_tokens = {"NA", "NaN", ""};

  bool is_missing_token(std::string_view tok) const;
};

// Abundance matrix:
//   <label>,sp1,sp2,...
//   com1,10,0,NA,...
// Blank lines and lines starting with '#' are skipped.
// Negative abundances, non-numeric cells and ragged rows are errors.
AbundanceTable read_abundance_csv(const fs::path& path, const TableReadOptions& opts = {});

// Trophic levels, one species per line after a header:
//   species,tl
//   sp1,2.5
// Missing levels are kept as NaN; IndexEngine reports them as InvalidInput.
TrophicLevels read_trophic_levels_csv(const fs::path& path, const TableReadOptions& opts = {});

} // namespace trophdiv
