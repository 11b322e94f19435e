//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef SPLITBENCH_EXECUTOR_H
#define SPLITBENCH_EXECUTOR_H

#include "except.h"
#include "probe.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace splitbench {

//! Iterations of the reference run: indices 0..20'000'000 inclusive.
constexpr uint64_t reference_iterations = 20000001;

//! Outcome of one timed run of one strategy.
class Run_result {
  std::chrono::nanoseconds elapsed_;
  uint64_t collection_delta_;

public:
  Run_result(): elapsed_(0), collection_delta_(0) {}

  Run_result(std::chrono::nanoseconds elapsed, uint64_t delta):
    elapsed_(elapsed), collection_delta_(delta) {}

  std::chrono::nanoseconds elapsed() const { return elapsed_; }
  uint64_t collection_delta() const { return collection_delta_; }

  double elapsed_ms() const
  {
    return std::chrono::duration<double, std::milli>(elapsed_).count();
  }
};

//! Drives one strategy through a fixed number of iterations.
/*! Iteration 0 is a warmup: the stopwatch starts on iteration 1, so
    one-time costs stay out of the measured time. Allocation readings
    bracket the whole loop, warmup included. */
class Run_executor {
  const Probe& probe_;
  std::string_view line_;
  uint64_t iterations_;

public:
  Run_executor(const Probe& p, std::string_view line, uint64_t iterations):
    probe_(p), line_(line), iterations_(iterations) {}

  uint64_t iterations() const { return iterations_; }
  std::string_view line() const { return line_; }

  //! Runs strategy.parse() and sink.consume() once per iteration.
  template <class Strategy, class Sink>
  Run_result run(const Strategy& strategy, Sink& sink) const;
};

template <class Strategy, class Sink>
Run_result Run_executor::run(const Strategy& strategy, Sink& sink) const
{
  if (iterations_ == 0)
    return Run_result();

  Stopwatch sw(probe_);
  const uint64_t before = probe_.collection_count();

  for (uint64_t i = 0; i < iterations_; ++i) {
    if (i == 1)
      sw.start(); // first pass is a warmup

    std::string_view line = line_;
    typename Strategy::Fields fields = strategy.parse(line);
    sink.consume(fields.method(), fields.resource(), fields.http_version());
  }

  sw.stop();
  const uint64_t after = probe_.collection_count();

  if (after < before)
    throw Probe_error("Collection count went from " + std::to_string(before) +
                      " down to " + std::to_string(after) + ".");

  return Run_result(sw.elapsed(), after - before);
}

} // namespace splitbench

#endif
