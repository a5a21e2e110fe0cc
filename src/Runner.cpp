#include "trophdiv/app/Runner.hpp"

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <string>

#if TROPHDIV_HAS_OPENMP
#include <omp.h>
#endif

#include "trophdiv/core/Tables.hpp"
#include "trophdiv/engine/IndexEngine.hpp"
#include "trophdiv/io/TableReaders.hpp"
#include "trophdiv/output/ResultWriter.hpp"
#include "trophdiv/output/ResultsIndex.hpp"
#include "trophdiv/util/Timer.hpp"

namespace fs = std::filesystem;

namespace {

fs::path resolve_path(const fs::path& base_dir, const std::string& p) {
  fs::path path(p);
  if (path.is_absolute() || base_dir.empty()) return path;
  return (base_dir / path).lexically_normal();
}

trophdiv::TableReadOptions read_options(const trophdiv::IniConfig& cfg) {
  trophdiv::TableReadOptions opts;
  opts.separator = cfg.get_char("input", "separator", std::optional<char>(','));
  opts.missing_tokens = cfg.get_list("input", "missing", std::optional<std::string>("NA,NaN"));
  if (cfg.get_bool("input", "empty_is_missing", std::optional<bool>(true))) {
    opts.missing_tokens.emplace_back("");
  }
  return opts;
}

} // namespace

namespace trophdiv {

Runner::Runner(const IniConfig& cfg, int threads_override)
    : cfg_(cfg), threads_override_(threads_override) {}

int Runner::run() { return run_impl_(false); }

int Runner::validate_config() { return run_impl_(true); }

int Runner::run_impl_(bool validate_only) {
  WallTimer total_timer;

  const fs::path base_dir = cfg_.base_dir();
  const fs::path abundance_path = resolve_path(base_dir, cfg_.get_string("input", "abundance"));
  const fs::path tl_path = resolve_path(base_dir, cfg_.get_string("input", "trophic_levels"));
  const TableReadOptions ropts = read_options(cfg_);

  const fs::path outdir = resolve_path(base_dir, cfg_.get_string("output", "dir", std::optional<std::string>("./out")));
  const std::string results_name = cfg_.get_string("output", "results", std::optional<std::string>("trophdiv.csv"));
  const std::string results_json_name = cfg_.get_string("output", "results_json", std::optional<std::string>("results.json"));
  const bool print_table = cfg_.get_bool("output", "print", std::optional<bool>(false));

  output::ResultWriteOptions wopts;
  wopts.separator = cfg_.get_char("output", "separator", std::optional<char>(ropts.separator));
  wopts.missing = cfg_.get_string("output", "missing", std::optional<std::string>("NA"));

  const std::int64_t cfg_threads = cfg_.get_int64("run", "threads", std::optional<std::int64_t>(0));
  if (cfg_threads < 0) throw std::runtime_error("[run] threads must be >= 0");
  const bool print_profile = cfg_.get_bool("run", "profile", std::optional<bool>(true));

  const int threads = threads_override_ > 0 ? threads_override_ : static_cast<int>(cfg_threads);
#if TROPHDIV_HAS_OPENMP
  if (threads > 0) omp_set_num_threads(threads);
#else
  if (threads > 1) {
    std::cerr << "[TROPHDIV] warning: built without OpenMP; threads=" << threads << " ignored\n";
  }
#endif

  // --- Load ---
  double t_load = 0.0;
  AbundanceTable ab;
  TrophicLevels tl;
  {
    ScopedTimer tm(&t_load);
    ab = read_abundance_csv(abundance_path, ropts);
    tl = read_trophic_levels_csv(tl_path, ropts);
  }

  IndexEngine::validate(ab, tl);

  if (validate_only) {
    std::cerr << "[TROPHDIV] validation OK (no indices computed)\n"
              << "         communities=" << ab.n_communities() << " species=" << ab.n_species() << "\n"
              << "         abundance=" << abundance_path.string() << "\n"
              << "         trophic_levels=" << tl_path.string() << "\n";
    return 0;
  }

  // --- Compute ---
  double t_compute = 0.0;
  ResultTable table;
  {
    ScopedTimer tm(&t_compute);
    table = IndexEngine(/*log_warnings=*/true).compute(ab, tl);
  }

  // --- Write ---
  std::error_code ec;
  fs::create_directories(outdir, ec);
  if (ec) throw std::runtime_error("failed to create output dir: " + outdir.string() + " (" + ec.message() + ")");

  const fs::path results_path = outdir / results_name;
  const fs::path results_json_path = outdir / results_json_name;
  output::write_results_csv(results_path, table, wopts);

  output::ResultsIndex idx;
  idx.trophdiv_version = TROPHDIV_VERSION_STR;
  if (!cfg_.file_path().empty()) {
    idx.config_path = cfg_.file_path().string();
    idx.config_fingerprint = output::make_fingerprint(cfg_.file_path());
  }
  idx.abundance_fingerprint = output::make_fingerprint(abundance_path);
  idx.trophic_levels_fingerprint = output::make_fingerprint(tl_path);
  idx.output_dir = outdir.string();
  idx.results_path = results_path.string();
  idx.missing_token = wopts.missing;
  idx.n_species = ab.n_species();
  output::summarize(idx, table);
#if TROPHDIV_HAS_OPENMP
  idx.threads = omp_get_max_threads();
#else
  idx.threads = 1;
#endif
  idx.load_seconds = t_load;
  idx.compute_seconds = t_compute;
  idx.wall_seconds = total_timer.elapsed_seconds();
  output::write_results_json(results_json_path, idx);

  if (print_table) {
    output::print_results(std::cout, table, wopts.missing);
  }

  if (print_profile) {
    std::cerr << "[TROPHDIV] profiling\n";
    std::cerr << "  wall_seconds: " << std::setprecision(6) << idx.wall_seconds << "\n";
    std::cerr << "  load_seconds: " << idx.load_seconds << "\n";
    std::cerr << "  compute_seconds: " << idx.compute_seconds << "\n";
    std::cerr << "  communities: " << idx.n_communities << " (undefined rows: " << idx.n_undefined_rows
              << ", FROm undefined: " << idx.n_from_undefined << ")\n";
    std::cerr << "  threads: " << idx.threads << "\n";
    std::cerr << "  results: " << results_path.string() << "\n";
    std::cerr << "  results_json: " << results_json_path.string() << "\n";
  }

  return 0;
}

} // namespace trophdiv
