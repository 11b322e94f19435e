//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef SPLITBENCH_REPORT_H
#define SPLITBENCH_REPORT_H

#include "api_export.h"
#include "orchestrator.h"

#include <ctime>
#include <ostream>
#include <string>

namespace splitbench {

//! Startup banner: package, line, trials and iterations.
LIBSPLITBENCH_API void print_banner(std::ostream&, const Run_options&);

//! One line with the collection delta and elapsed time of a run.
LIBSPLITBENCH_API void print_trial_line(std::ostream&, size_t trial, Strategy_kind, const Run_result&);

//! One line with the mean elapsed time of every strategy.
LIBSPLITBENCH_API void print_summary(std::ostream&, const Suite_result&);

//! Local "YYYY-MM-DD HH:MM:SS", or "unknown" if t cannot be converted.
LIBSPLITBENCH_API std::string format_run_date(std::time_t t);

//! Writes the baseline text (header comments, then "name: mean_ms" lines).
LIBSPLITBENCH_API void write_baseline(std::ostream&, const Suite_result&);

//! Writes the baseline to a file. Returns false if it cannot be opened.
LIBSPLITBENCH_API bool save_baseline(const std::string& filename, const Suite_result&);

} // namespace splitbench

#endif
