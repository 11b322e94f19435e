//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef SPLITBENCH_ALLOC_COUNTER_H
#define SPLITBENCH_ALLOC_COUNTER_H

#include "api_export.h"

#include <cstdint>

//! Process-wide heap allocation counters.
/*! Linking alloc_counter.cc replaces the global operator new/delete
    (plain, array, nothrow and sized forms) with malloc-based versions
    that count every successful allocation. Aligned forms are left to
    the standard library and are not counted. */
namespace splitbench {
namespace alloc_counter {

//! Allocation calls since process start.
LIBSPLITBENCH_API uint64_t allocation_calls();

//! Bytes requested since process start.
LIBSPLITBENCH_API uint64_t allocated_bytes();

} // namespace alloc_counter
} // namespace splitbench

#endif
