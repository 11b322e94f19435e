//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef SPLITBENCH_LIBSPLITBENCH_H
#define SPLITBENCH_LIBSPLITBENCH_H

#include "except.h"
#include "owned_text.h"
#include "strategies.h"
#include "probe.h"
#include "sink.h"
#include "executor.h"
#include "orchestrator.h"
#include "report.h"
#include "config.h"

#endif
