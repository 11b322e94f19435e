//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#include "probe.h"
#include "alloc_counter.h"
#include "except.h"

#include <new>

namespace splitbench {

static_assert(Probe::Clock::is_steady, "benchmark clock must be monotonic");

System_probe::System_probe()
{
  const uint64_t before = alloc_counter::allocation_calls();

  // volatile keeps the allocation from being folded away
  void* volatile p = ::operator new(1);
  ::operator delete(p);

  if (alloc_counter::allocation_calls() == before)
    throw Probe_unavailable("Global operator new is not instrumented.");
}

Probe::Time_point System_probe::now() const
{
  return Clock::now();
}

uint64_t System_probe::collection_count() const
{
  return alloc_counter::allocation_calls();
}

// ----------------------------------------------------------------------------
void Stopwatch::start()
{
  if (running_)
    return;

  running_ = true;
  start_ = probe_.now();
}

void Stopwatch::stop()
{
  if (!running_)
    return;

  Probe::Time_point end = probe_.now();
  running_ = false;

  if (end > start_)
    elapsed_ += std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_);
}

} // namespace splitbench
