#include "trophdiv/io/TableReaders.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include "trophdiv/util/Parse.hpp"

namespace trophdiv {

namespace {

inline std::runtime_error die(const fs::path& path, std::size_t lineno, const std::string& msg) {
  return std::runtime_error("TableReader[" + path.string() + ":" + std::to_string(lineno) + "]: " + msg);
}

inline bool skip_line(std::string_view s) {
  s = trim_view(s);
  return s.empty() || s.front() == '#';
}

double parse_cell(std::string_view tok, const TableReadOptions& opts,
                  const fs::path& path, std::size_t lineno, const std::string& what) {
  if (opts.is_missing_token(tok)) return kMissing;
  double v = 0.0;
  if (!parse_double(tok, v) || !std::isfinite(v)) {
    throw die(path, lineno, "invalid numeric value for " + what + ": '" + std::string(tok) + "'");
  }
  return v;
}

} // namespace

bool TableReadOptions::is_missing_token(std::string_view tok) const {
  return std::find(missing_tokens.begin(), missing_tokens.end(), tok) != missing_tokens.end();
}

AbundanceTable read_abundance_csv(const fs::path& path, const TableReadOptions& opts) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error("TableReader: failed to open abundance table: " + path.string());

  std::vector<std::string> species;
  std::vector<std::string> communities;
  std::vector<double> values;
  std::unordered_set<std::string> seen_species;
  std::unordered_set<std::string> seen_communities;

  std::vector<std::string_view> cells;
  std::string line;
  std::size_t lineno = 0;
  bool have_header = false;

  while (std::getline(ifs, line)) {
    ++lineno;
    if (skip_line(line)) continue;
    split_cells(line, opts.separator, cells);

    if (!have_header) {
      if (cells.size() < 2) {
        throw die(path, lineno, "header must hold a label column and at least one species");
      }
      for (std::size_t j = 1; j < cells.size(); ++j) {
        std::string sp(cells[j]);
        if (sp.empty()) throw die(path, lineno, "empty species name in header (column " + std::to_string(j + 1) + ")");
        if (!seen_species.insert(sp).second) throw die(path, lineno, "duplicate species name in header: " + sp);
        species.push_back(std::move(sp));
      }
      have_header = true;
      continue;
    }

    std::string community(cells[0]);
    if (community.empty()) throw die(path, lineno, "empty community label");
    if (!seen_communities.insert(community).second) {
      throw die(path, lineno, "duplicate community label: " + community);
    }
    if (cells.size() != species.size() + 1) {
      throw die(path, lineno, "community '" + community + "' has " + std::to_string(cells.size() - 1) +
                                  " cells, expected " + std::to_string(species.size()));
    }

    for (std::size_t j = 0; j < species.size(); ++j) {
      const double v = parse_cell(cells[j + 1], opts, path, lineno, community + "/" + species[j]);
      if (v < 0.0) {
        throw die(path, lineno, "negative abundance for " + community + "/" + species[j]);
      }
      values.push_back(v);
    }
    communities.push_back(std::move(community));
  }

  if (!have_header) throw std::runtime_error("TableReader: abundance table is empty: " + path.string());
  if (communities.empty()) throw std::runtime_error("TableReader: no community rows in: " + path.string());

  return AbundanceTable(std::move(communities), std::move(species), std::move(values));
}

TrophicLevels read_trophic_levels_csv(const fs::path& path, const TableReadOptions& opts) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error("TableReader: failed to open trophic levels: " + path.string());

  TrophicLevels tl;
  std::unordered_set<std::string> seen;

  std::vector<std::string_view> cells;
  std::string line;
  std::size_t lineno = 0;
  bool have_header = false;

  while (std::getline(ifs, line)) {
    ++lineno;
    if (skip_line(line)) continue;
    if (!have_header) {
      have_header = true;
      continue;
    }

    split_cells(line, opts.separator, cells);
    if (cells.size() != 2) {
      throw die(path, lineno, "expected 'species" + std::string(1, opts.separator) + "level', got " +
                                  std::to_string(cells.size()) + " cells");
    }
    std::string sp(cells[0]);
    if (sp.empty()) throw die(path, lineno, "empty species name");
    if (!seen.insert(sp).second) throw die(path, lineno, "duplicate species: " + sp);

    tl.levels.push_back(parse_cell(cells[1], opts, path, lineno, "trophic level of " + sp));
    tl.species.push_back(std::move(sp));
  }

  if (tl.species.empty()) throw std::runtime_error("TableReader: no trophic levels in: " + path.string());
  return tl;
}

} // namespace trophdiv
