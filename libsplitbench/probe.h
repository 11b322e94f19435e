//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef SPLITBENCH_PROBE_H
#define SPLITBENCH_PROBE_H

#include "api_export.h"

#include <chrono>
#include <cstdint>

namespace splitbench {

//! Abstract source of time and allocation readings.
/*! Readings are taken outside of the measured loop only, so the
    virtual call does not distort per-iteration costs. */
class LIBSPLITBENCH_API Probe {
public:
  typedef std::chrono::steady_clock Clock;
  typedef Clock::time_point Time_point;

  virtual ~Probe() = default;

  //! Monotonic instant.
  virtual Time_point now() const = 0;

  //! Non-decreasing count of allocation events since process start.
  virtual uint64_t collection_count() const = 0;
};

//! Steady clock plus the global allocation counter.
/*! C++ has no collector, so a "collection" here is one call to the
    global operator new. */
class LIBSPLITBENCH_API System_probe: public Probe {
public:
  //! Throws Probe_unavailable if the allocation counter does not move.
  System_probe();

  Time_point now() const override;
  uint64_t collection_count() const override;
};

//! Start/stop timer driven by a Probe.
/*! Elapsed time is zero until start() is called; stop() on a
    stopwatch that is not running does nothing. */
class LIBSPLITBENCH_API Stopwatch {
  const Probe& probe_;
  Probe::Time_point start_;
  std::chrono::nanoseconds elapsed_;
  bool running_;

public:
  explicit Stopwatch(const Probe& p):
    probe_(p), start_(), elapsed_(0), running_(false) {}

  Stopwatch(const Stopwatch&) = delete;
  Stopwatch& operator=(const Stopwatch&) = delete;

  void start();
  void stop();

  bool running() const { return running_; }
  std::chrono::nanoseconds elapsed() const { return elapsed_; }
};

} // namespace splitbench

#endif
