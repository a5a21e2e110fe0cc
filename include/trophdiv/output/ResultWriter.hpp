#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "trophdiv/core/Tables.hpp"
#include "trophdiv/util/AtomicFile.hpp"

namespace trophdiv::output {
namespace fs = std::filesystem;

struct ResultWriteOptions {
  char separator = ',';
  std::string missing = "NA"; // rendering of undefined cells
  std::string label_column = "community";
};

inline std::string format_number(double x) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.15g", x);
  return std::string(buf);
}

inline std::string format_cell(const std::optional<double>& v, const std::string& missing) {
  return v ? format_number(*v) : missing;
}

// Rendered cells of one row, kIndexColumns order.
inline std::vector<std::string> row_cells(const CommunityRow& row, const std::string& missing) {
  std::vector<std::string> cells;
  cells.reserve(kIndexColumns.size());
  for (std::size_t c = 0; c < kIndexColumns.size(); ++c) {
    cells.push_back(row.indices ? format_cell(index_value(*row.indices, c), missing) : missing);
  }
  return cells;
}

inline void write_results_table(std::ostream& os, const ResultTable& table, const ResultWriteOptions& opts = {}) {
  os << opts.label_column;
  for (const char* name : kIndexColumns) os << opts.separator << name;
  os << "\n";
  for (const auto& row : table.rows) {
    os << row.label;
    for (const auto& cell : row_cells(row, opts.missing)) os << opts.separator << cell;
    os << "\n";
  }
}

inline void write_results_csv(const fs::path& out_path, const ResultTable& table,
                              const ResultWriteOptions& opts = {}) {
  util::atomic_write_text(out_path, [&](std::ostream& os) { write_results_table(os, table, opts); });
}

// Column-aligned table for terminal output.
inline void print_results(std::ostream& os, const ResultTable& table, const std::string& missing = "NA") {
  std::vector<std::vector<std::string>> grid;
  grid.reserve(table.rows.size() + 1);
  {
    std::vector<std::string> header{""};
    for (const char* name : kIndexColumns) header.emplace_back(name);
    grid.push_back(std::move(header));
  }
  for (const auto& row : table.rows) {
    std::vector<std::string> line{row.label};
    for (auto& cell : row_cells(row, missing)) line.push_back(std::move(cell));
    grid.push_back(std::move(line));
  }

  std::vector<std::size_t> width(kIndexColumns.size() + 1, 0);
  for (const auto& line : grid) {
    for (std::size_t c = 0; c < line.size(); ++c) width[c] = std::max(width[c], line[c].size());
  }

  for (const auto& line : grid) {
    for (std::size_t c = 0; c < line.size(); ++c) {
      if (c == 0) {
        os << line[c] << std::string(width[c] - line[c].size(), ' ');
      } else {
        os << "  " << std::string(width[c] - line[c].size(), ' ') << line[c];
      }
    }
    os << "\n";
  }
}

// Inputs are echoed the same way by the --example mode.
inline void print_inputs(std::ostream& os, const AbundanceTable& ab, const TrophicLevels& tl,
                         const std::string& missing = "NA") {
  std::vector<std::size_t> width(ab.n_species(), 0);
  for (std::size_t j = 0; j < ab.n_species(); ++j) {
    width[j] = ab.species()[j].size();
    for (std::size_t i = 0; i < ab.n_communities(); ++i) {
      const double v = ab.at(i, j);
      width[j] = std::max(width[j], (is_missing(v) ? missing : format_number(v)).size());
    }
  }
  std::size_t label_w = 0;
  for (const auto& c : ab.communities()) label_w = std::max(label_w, c.size());

  os << std::string(label_w, ' ');
  for (std::size_t j = 0; j < ab.n_species(); ++j) {
    os << "  " << std::string(width[j] - ab.species()[j].size(), ' ') << ab.species()[j];
  }
  os << "\n";
  for (std::size_t i = 0; i < ab.n_communities(); ++i) {
    os << ab.communities()[i] << std::string(label_w - ab.communities()[i].size(), ' ');
    for (std::size_t j = 0; j < ab.n_species(); ++j) {
      const double v = ab.at(i, j);
      const std::string s = is_missing(v) ? missing : format_number(v);
      os << "  " << std::string(width[j] - s.size(), ' ') << s;
    }
    os << "\n";
  }
  os << "\ntrophic levels:";
  for (std::size_t j = 0; j < tl.size(); ++j) {
    os << " " << tl.species[j] << "=" << (is_missing(tl.levels[j]) ? missing : format_number(tl.levels[j]));
  }
  os << "\n";
}

} // namespace trophdiv::output
