//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#include "report.h"
#include "version.h"

#include <ctime>
#include <fstream>
#include <iomanip>

namespace splitbench {

void print_banner(std::ostream& os, const Run_options& opts)
{
  os << "============================================================\n";
  os << PACKAGE " " VERSION " - Request Line Splitting Benchmarks\n";
  os << "Line: \"" << opts.line << "\"\n";
  os << "Trials: " << opts.trials << ", iterations per run: " << opts.iterations << "\n";
  os << "============================================================\n";
}

void print_trial_line(std::ostream& os, size_t trial, Strategy_kind k, const Run_result& r)
{
  os << "[PERF] trial " << std::setw(3) << std::right << (trial + 1) << " "
     << std::setw(10) << std::left << strategy_name(k) << ": "
     << "collections=" << r.collection_delta() << ", "
     << std::fixed << std::setprecision(3) << r.elapsed_ms() << " ms"
     << std::endl;
}

void print_summary(std::ostream& os, const Suite_result& result)
{
  os << "[PERF] ";
  bool first = true;
  for (Strategy_kind k : strategy_order) {
    if (!first)
      os << ", ";
    first = false;

    os << strategy_name(k) << " avg: "
       << std::fixed << std::setprecision(3) << result[k].mean_elapsed_ms() << " ms";
  }
  os << std::endl;
}

std::string format_run_date(std::time_t t)
{
  const std::tm* tm = std::localtime(&t);
  if (!tm)
    return "unknown";

  char time_buf[64];
  if (std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", tm) == 0)
    return "unknown";

  return time_buf;
}

void write_baseline(std::ostream& out, const Suite_result& result)
{
  out << "# Performance Baseline - " PACKAGE " " VERSION "\n";
  out << "# Run date: " << format_run_date(std::time(nullptr)) << "\n";
  out << "# Trials: " << result.trials() << "\n";
  out << "# Iterations per run: " << result.iterations() << "\n";
  out << "#\n";
  out << "# Format: strategy_name: mean_ms\n";
  out << "#\n";

  for (Strategy_kind k : strategy_order) {
    out << strategy_name(k) << ": "
        << std::fixed << std::setprecision(3) << result[k].mean_elapsed_ms() << "\n";
  }
}

bool save_baseline(const std::string& filename, const Suite_result& result)
{
  std::ofstream out(filename);
  if (!out)
    return false;

  write_baseline(out, result);
  return static_cast<bool>(out);
}

} // namespace splitbench
