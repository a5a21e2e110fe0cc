#pragma once

#include "trophdiv/config/IniConfig.hpp"

namespace trophdiv {

// Runner: config-driven pipeline.
//
// main() only handles the CLI, then calls Runner(cfg).run().
// Runner owns the pipeline: load tables -> validate -> compute -> write
// results table + results.json.
class Runner {
public:
  // threads_override > 0 takes precedence over [run] threads.
  explicit Runner(const IniConfig& cfg, int threads_override = 0);

  // Execute the run. Returns 0 on success.
  int run();

  // Load both tables and run the engine's structural checks without computing
  // indices or writing results (CLI: --validate-config).
  int validate_config();

private:
  const IniConfig& cfg_;
  int threads_override_ = 0;

  int run_impl_(bool validate_only);
};

} // namespace trophdiv
