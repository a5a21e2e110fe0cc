#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "trophdiv/app/Runner.hpp"
#include "trophdiv/config/IniConfig.hpp"
#include "trophdiv/engine/IndexEngine.hpp"
#include "trophdiv/io/ExampleData.hpp"
#include "trophdiv/output/ResultWriter.hpp"

namespace fs = std::filesystem;

namespace {

struct Cli {
  fs::path config;
  int threads = 0; // 0 = [run] threads, else OpenMP default
  bool validate_config = false;
  bool example = false;
  std::uint64_t seed = 1;
};

void print_usage(const char* argv0) {
  std::cerr
      << "Usage: " << argv0 << " --config <path> [--threads N] [--validate-config]\n"
      << "       " << argv0 << " --example [--seed N]\n"
      << "       " << argv0 << " --version\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli cli;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (a == "--version") {
      std::cout << TROPHDIV_VERSION_STR << "\n";
      std::exit(0);
    } else if (a == "--config") {
      if (i + 1 >= argc) throw std::runtime_error("--config requires a value");
      cli.config = fs::path(argv[++i]);
    } else if (a == "--threads") {
      if (i + 1 >= argc) throw std::runtime_error("--threads requires a value");
      cli.threads = std::stoi(argv[++i]);
      if (cli.threads < 0) throw std::runtime_error("--threads must be >= 0");
    } else if (a == "--validate-config") {
      cli.validate_config = true;
    } else if (a == "--example") {
      cli.example = true;
    } else if (a == "--seed") {
      if (i + 1 >= argc) throw std::runtime_error("--seed requires a value");
      cli.seed = std::stoull(argv[++i]);
    } else {
      throw std::runtime_error("unknown argument: " + a);
    }
  }
  if (!cli.example && cli.config.empty()) {
    throw std::runtime_error("--config is required (or use --example)");
  }
  return cli;
}

int run_example(std::uint64_t seed) {
  const trophdiv::ExampleData ex = trophdiv::make_example(seed);
  trophdiv::output::print_inputs(std::cout, ex.abundances, ex.trophic_levels);
  std::cout << "\n";
  const trophdiv::ResultTable res = trophdiv::IndexEngine().compute(ex.abundances, ex.trophic_levels);
  trophdiv::output::print_results(std::cout, res);
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  try {
    Cli cli = parse_cli(argc, argv);

    if (cli.example) {
      return run_example(cli.seed);
    }

    trophdiv::IniConfig cfg(cli.config);
    trophdiv::Runner runner(cfg, cli.threads);
    if (cli.validate_config) {
      return runner.validate_config();
    }
    return runner.run();

  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
}
