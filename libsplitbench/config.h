//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef SPLITBENCH_CONFIG_H
#define SPLITBENCH_CONFIG_H

#include "api_export.h"
#include "orchestrator.h"

#include <cstdint>
#include <ostream>
#include <string>

namespace splitbench {

//! Command line configuration of the benchmark executable.
/*! Defaults reproduce the reference run: 10 trials of 20'000'001
    iterations over the reference line. */
struct LIBSPLITBENCH_API Bench_config {
  int trials = 10;
  int64_t iterations = static_cast<int64_t>(reference_iterations);
  std::string baseline_file;
  bool quiet = false;

  //! Parses options. Returns false if help was requested (usage
  //! is written to out). Throws Bad_config on invalid options.
  bool parse(int argc, const char* const argv[], std::ostream& out);

  Run_options run_options() const;
};

} // namespace splitbench

#endif
