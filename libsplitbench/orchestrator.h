//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef SPLITBENCH_ORCHESTRATOR_H
#define SPLITBENCH_ORCHESTRATOR_H

#include "api_export.h"
#include "executor.h"
#include "strategies.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <vector>

namespace splitbench {

//! Order in which every trial runs the strategies. Never shuffled:
//! later strategies in a trial run on warmer caches.
constexpr std::array<Strategy_kind, strategy_count> strategy_order = {{
  Strategy_kind::split,
  Strategy_kind::index_substring,
  Strategy_kind::slice
}};

//! Results of one strategy across all trials.
class LIBSPLITBENCH_API Aggregate_result {
  Strategy_kind kind_;
  std::vector<Run_result> runs_;

public:
  explicit Aggregate_result(Strategy_kind k): kind_(k), runs_() {}

  void add(const Run_result& r) { runs_.push_back(r); }

  Strategy_kind kind() const { return kind_; }
  const std::vector<Run_result>& runs() const { return runs_; }
  size_t size() const { return runs_.size(); }

  //! Arithmetic mean of elapsed time; 0 when there are no runs.
  double mean_elapsed_ms() const;
  double min_elapsed_ms() const;
  double max_elapsed_ms() const;
  uint64_t total_collections() const;
};

//! Per-strategy aggregates of a whole benchmark run.
class LIBSPLITBENCH_API Suite_result {
  uint64_t iterations_;
  std::array<Aggregate_result, strategy_count> aggregates_;

public:
  explicit Suite_result(uint64_t iterations);

  uint64_t iterations() const { return iterations_; }

  Aggregate_result& operator[](Strategy_kind k);
  const Aggregate_result& operator[](Strategy_kind k) const;

  //! Number of trials completed by every strategy.
  size_t trials() const;

  //! Total Run_result count over all strategies.
  size_t run_count() const;
};

struct Run_options {
  size_t trials = 10;
  uint64_t iterations = reference_iterations;
  std::string_view line = reference_line;
};

//! Runs every strategy once per trial and collects the results.
class LIBSPLITBENCH_API Trial_orchestrator {
  const Probe& probe_;
  Run_options opts_;
  std::ostream* report_;

public:
  //! Throws Bad_config when opts.trials is 0.
  Trial_orchestrator(const Probe&, const Run_options& opts);

  //! Set stream receiving per-trial lines. Transfer NULL to turn them off.
  void set_report_stream(std::ostream*);

  const Run_options& options() const { return opts_; }

  Suite_result run();

  //! Appends one Run_result per strategy to the result, in strategy_order.
  void run_trial(size_t trial, Suite_result& result);

  //! Single timed run of one strategy.
  Run_result run_strategy(Strategy_kind k) const;
};

} // namespace splitbench

#endif
