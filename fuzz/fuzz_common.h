// Common utilities for fuzz targets

#ifndef SPLITBENCH_FUZZ_COMMON_H
#define SPLITBENCH_FUZZ_COMMON_H

#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <string_view>

namespace fuzz {

// Maximum input size to prevent slow units
constexpr size_t MAX_INPUT_SIZE = 64 * 1024;

// Report a broken property. abort() lets libFuzzer save the crashing input.
inline void require(bool cond) {
  if (!cond) std::abort();
}

// True if the field is a subrange of line.
inline bool within(std::string_view field, std::string_view line) {
  return field.data() >= line.data() &&
         field.data() + field.size() <= line.data() + line.size();
}

// True if the text holds any isspace() character.
inline bool has_space(std::string_view s) {
  for (char c : s)
    if (std::isspace(static_cast<unsigned char>(c))) return true;
  return false;
}

} // namespace fuzz

#endif // SPLITBENCH_FUZZ_COMMON_H
