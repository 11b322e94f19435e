//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef SPLITBENCH_SINK_H
#define SPLITBENCH_SINK_H

#include "api_export.h"
#include "owned_text.h"

#include <string_view>

namespace splitbench {

// Prevent compiler from optimizing away results
template<typename T>
inline void do_not_optimize(const T& value) {
  asm volatile("" : : "r,m"(value) : "memory");
}

//! Consumer of parsed fields that does nothing observable.
/*! Every field escapes through do_not_optimize, so neither the parse
    nor this call can be removed by the optimizer. */
class LIBSPLITBENCH_API Null_sink {
public:
  void consume(const Owned_text& method, const Owned_text& resource, const Owned_text& version)
  {
    consume(method.view(), resource.view(), version.view());
  }

  void consume(std::string_view method, std::string_view resource, std::string_view version)
  {
    escape(method);
    escape(resource);
    escape(version);
  }

private:
  static void escape(std::string_view s)
  {
    const char* data = s.data();
    size_t size = s.size();
    do_not_optimize(data);
    do_not_optimize(size);
  }
};

} // namespace splitbench

#endif
