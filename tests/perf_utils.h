#ifndef SPLITBENCH_PERF_UTILS_H
#define SPLITBENCH_PERF_UTILS_H

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

namespace perf {

// Three trials of a tenth of the reference iteration count keep the
// perf test within a few seconds while still dwarfing timer resolution.
constexpr size_t TRIALS = 3;
constexpr uint64_t ITERATIONS = 2000001;

// Print section header
inline void section(const std::string& name) {
  std::cout << "\n--- " << name << " ---\n";
}

} // namespace perf

#endif // SPLITBENCH_PERF_UTILS_H
