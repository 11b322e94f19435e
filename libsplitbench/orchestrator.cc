//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#include "orchestrator.h"
#include "except.h"
#include "report.h"
#include "sink.h"

#include <algorithm>
#include <numeric>

namespace splitbench {

double Aggregate_result::mean_elapsed_ms() const
{
  if (runs_.empty())
    return 0.0;

  double sum = 0.0;
  for (const auto& r : runs_)
    sum += r.elapsed_ms();

  return sum / static_cast<double>(runs_.size());
}

double Aggregate_result::min_elapsed_ms() const
{
  if (runs_.empty())
    return 0.0;

  auto it = std::min_element(runs_.begin(), runs_.end(),
    [](const Run_result& a, const Run_result& b) { return a.elapsed() < b.elapsed(); });
  return it->elapsed_ms();
}

double Aggregate_result::max_elapsed_ms() const
{
  if (runs_.empty())
    return 0.0;

  auto it = std::max_element(runs_.begin(), runs_.end(),
    [](const Run_result& a, const Run_result& b) { return a.elapsed() < b.elapsed(); });
  return it->elapsed_ms();
}

uint64_t Aggregate_result::total_collections() const
{
  return std::accumulate(runs_.begin(), runs_.end(), uint64_t(0),
    [](uint64_t acc, const Run_result& r) { return acc + r.collection_delta(); });
}

// ----------------------------------------------------------------------------
Suite_result::Suite_result(uint64_t iterations):
  iterations_(iterations),
  aggregates_{{
    Aggregate_result(Strategy_kind::split),
    Aggregate_result(Strategy_kind::index_substring),
    Aggregate_result(Strategy_kind::slice)
  }}
{
}

Aggregate_result& Suite_result::operator[](Strategy_kind k)
{
  return aggregates_[static_cast<size_t>(k)];
}

const Aggregate_result& Suite_result::operator[](Strategy_kind k) const
{
  return aggregates_[static_cast<size_t>(k)];
}

size_t Suite_result::trials() const
{
  size_t n = aggregates_[0].size();
  for (const auto& a : aggregates_)
    n = std::min(n, a.size());
  return n;
}

size_t Suite_result::run_count() const
{
  size_t n = 0;
  for (const auto& a : aggregates_)
    n += a.size();
  return n;
}

// ----------------------------------------------------------------------------
Trial_orchestrator::Trial_orchestrator(const Probe& p, const Run_options& opts):
  probe_(p),
  opts_(opts),
  report_(nullptr)
{
  if (opts_.trials == 0)
    throw Bad_config("Number of trials must be positive.");
}

void Trial_orchestrator::set_report_stream(std::ostream* os)
{
  report_ = os;
}

Suite_result Trial_orchestrator::run()
{
  Suite_result result(opts_.iterations);

  for (size_t trial = 0; trial < opts_.trials; ++trial)
    run_trial(trial, result);

  return result;
}

void Trial_orchestrator::run_trial(size_t trial, Suite_result& result)
{
  for (Strategy_kind k : strategy_order) {
    Run_result r = run_strategy(k);
    result[k].add(r);

    if (report_)
      print_trial_line(*report_, trial, k, r);
  }
}

Run_result Trial_orchestrator::run_strategy(Strategy_kind k) const
{
  Run_executor executor(probe_, opts_.line, opts_.iterations);
  Null_sink sink;

  switch (k) {
  case Strategy_kind::split:
    return executor.run(Split_strategy(), sink);
  case Strategy_kind::index_substring:
    return executor.run(Index_substring_strategy(), sink);
  case Strategy_kind::slice:
    return executor.run(Slice_strategy(), sink);
  }

  throw Bad_config("Unknown strategy.");
}

} // namespace splitbench
