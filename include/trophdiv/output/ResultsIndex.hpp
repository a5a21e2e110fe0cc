#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "trophdiv/core/Tables.hpp"
#include "trophdiv/util/AtomicFile.hpp"
#include "trophdiv/util/Hash.hpp"

namespace trophdiv::output {
namespace fs = std::filesystem;

// Bump when results.json changes in a non-backward-compatible way.
inline constexpr const char* RESULTS_SCHEMA_VERSION = "1.0";

struct FileFingerprint {
  std::string path;
  std::uint64_t size_bytes = 0;
  std::int64_t mtime_epoch_s = 0; // best-effort
  std::string hash_fnv1a64_hex;
};

struct ResultsIndex {
  std::string schema_version = RESULTS_SCHEMA_VERSION;
  std::string trophdiv_version;

  std::string config_path;
  FileFingerprint config_fingerprint;
  FileFingerprint abundance_fingerprint;
  FileFingerprint trophic_levels_fingerprint;

  std::string output_dir;
  std::string results_path;
  std::string missing_token = "NA";

  std::size_t n_communities = 0;
  std::size_t n_species = 0;
  std::size_t n_undefined_rows = 0;
  std::size_t n_from_undefined = 0; // rows with FROm undefined (includes undefined rows)

  std::vector<RowWarning> warnings;

  int threads = 1;
  double load_seconds = 0.0;
  double compute_seconds = 0.0;
  double wall_seconds = 0.0;
};

inline std::int64_t file_time_to_epoch_seconds(fs::file_time_type t) {
  using namespace std::chrono;
  const auto now_fs = fs::file_time_type::clock::now();
  const auto now_sys = system_clock::now();
  const auto sys_time = time_point_cast<system_clock::duration>(t - now_fs + now_sys);
  return duration_cast<seconds>(sys_time.time_since_epoch()).count();
}

inline FileFingerprint make_fingerprint(const fs::path& p) {
  FileFingerprint fp;
  fp.path = p.string();
  std::error_code ec;
  const auto sz = fs::file_size(p, ec);
  fp.size_bytes = ec ? 0ull : static_cast<std::uint64_t>(sz);
  const auto mt = fs::last_write_time(p, ec);
  fp.mtime_epoch_s = ec ? 0 : file_time_to_epoch_seconds(mt);
  fp.hash_fnv1a64_hex = hex_u64(fnv1a64_file(p.string()));
  return fp;
}

// Counts derived from a computed table.
inline void summarize(ResultsIndex& idx, const ResultTable& table) {
  idx.n_communities = table.size();
  idx.n_undefined_rows = 0;
  idx.n_from_undefined = 0;
  for (const auto& row : table.rows) {
    if (!row.indices) ++idx.n_undefined_rows;
    if (!row.indices || !row.indices->FROm) ++idx.n_from_undefined;
  }
  idx.warnings = table.warnings;
}

inline std::string json_escape(const std::string& s) {
  std::ostringstream oss;
  for (unsigned char c : s) {
    switch (c) {
      case '\\': oss << "\\\\"; break;
      case '"':  oss << "\\\""; break;
      case '\b': oss << "\\b"; break;
      case '\f': oss << "\\f"; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      default:
        if (c < 0x20) {
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
        } else {
          oss << c;
        }
    }
  }
  return oss.str();
}

inline void write_results_json(std::ostream& ofs, const ResultsIndex& idx) {
  auto q = [](const std::string& s) { return std::string("\"") + json_escape(s) + "\""; };

  auto write_fingerprint = [&](const FileFingerprint& fp) {
    ofs << "{\"path\": " << q(fp.path)
        << ", \"size_bytes\": " << fp.size_bytes
        << ", \"mtime_epoch_s\": " << fp.mtime_epoch_s
        << ", \"hash_fnv1a64\": " << q(fp.hash_fnv1a64_hex) << "}";
  };

  ofs << "{\n";
  ofs << "  \"schema_version\": " << q(idx.schema_version) << ",\n";
  ofs << "  \"trophdiv_version\": " << q(idx.trophdiv_version) << ",\n";
  ofs << "  \"run\": {\n";
  ofs << "    \"config_path\": " << q(idx.config_path) << ",\n";
  ofs << "    \"config_fingerprint\": ";
  write_fingerprint(idx.config_fingerprint);
  ofs << ",\n";
  ofs << "    \"abundance_fingerprint\": ";
  write_fingerprint(idx.abundance_fingerprint);
  ofs << ",\n";
  ofs << "    \"trophic_levels_fingerprint\": ";
  write_fingerprint(idx.trophic_levels_fingerprint);
  ofs << ",\n";
  ofs << "    \"output_dir\": " << q(idx.output_dir) << ",\n";
  ofs << "    \"threads\": " << idx.threads << "\n";
  ofs << "  },\n";

  ofs << "  \"results\": {\n";
  ofs << "    \"path\": " << q(idx.results_path) << ",\n";
  ofs << "    \"columns\": [";
  for (std::size_t i = 0; i < kIndexColumns.size(); ++i) {
    ofs << q(kIndexColumns[i]);
    if (i + 1 < kIndexColumns.size()) ofs << ", ";
  }
  ofs << "],\n";
  ofs << "    \"missing\": " << q(idx.missing_token) << ",\n";
  ofs << "    \"communities\": " << idx.n_communities << ",\n";
  ofs << "    \"species\": " << idx.n_species << ",\n";
  ofs << "    \"undefined_rows\": " << idx.n_undefined_rows << ",\n";
  ofs << "    \"from_undefined\": " << idx.n_from_undefined << "\n";
  ofs << "  },\n";

  ofs << "  \"warnings\": [";
  for (std::size_t i = 0; i < idx.warnings.size(); ++i) {
    const auto& w = idx.warnings[i];
    ofs << (i == 0 ? "\n" : ",\n");
    ofs << "    {\"row\": " << (w.row + 1)
        << ", \"community\": " << q(w.community)
        << ", \"message\": " << q(w.message) << "}";
  }
  ofs << (idx.warnings.empty() ? "],\n" : "\n  ],\n");

  ofs << "  \"profiling\": {\n";
  ofs << "    \"load_seconds\": " << std::setprecision(17) << idx.load_seconds << ",\n";
  ofs << "    \"compute_seconds\": " << std::setprecision(17) << idx.compute_seconds << ",\n";
  ofs << "    \"wall_seconds\": " << std::setprecision(17) << idx.wall_seconds << "\n";
  ofs << "  }\n";
  ofs << "}\n";
}

inline void write_results_json(const fs::path& out_path, const ResultsIndex& idx) {
  util::atomic_write_text(out_path, [&](std::ostream& ofs) { write_results_json(ofs, idx); });
}

} // namespace trophdiv::output
