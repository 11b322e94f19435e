//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#include "config.h"
#include "except.h"

#include <sstream>

#include <boost/program_options.hpp>

namespace splitbench {

bool Bench_config::parse(int argc, const char* const argv[], std::ostream& out)
{
  namespace po = boost::program_options;

  po::options_description desc("Split Benchmark Options");
  desc.add_options()
    ("help,h", "Show this help message")
    ("trials,n", po::value<int>(&trials)->default_value(10),
      "Number of trials; every trial runs each strategy once")
    ("iterations,i", po::value<int64_t>(&iterations)->default_value(static_cast<int64_t>(reference_iterations)),
      "Iterations per run, the first one being a warmup")
    ("baseline,b", po::value<std::string>(&baseline_file),
      "Write per-strategy means to this file")
    ("quiet,q", po::bool_switch(&quiet),
      "Suppress banner and per-trial lines");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::ostringstream usage;
    usage << e.what() << "\n\n" << desc;
    throw Bad_config(usage.str());
  }

  if (vm.count("help")) {
    out << desc << "\n";
    out << "\nExample:\n";
    out << "  " << (argc > 0 ? argv[0] : "split-benchmark") << " --trials 10 --iterations 20000001\n";
    return false;
  }

  if (trials <= 0)
    throw Bad_config("Trial count must be positive.");

  if (iterations < 0)
    throw Bad_config("Iteration count must not be negative.");

  return true;
}

Run_options Bench_config::run_options() const
{
  Run_options opts;
  opts.trials = static_cast<size_t>(trials);
  opts.iterations = static_cast<uint64_t>(iterations);
  return opts;
}

} // namespace splitbench
