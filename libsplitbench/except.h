//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef SPLITBENCH_EXCEPT_H
#define SPLITBENCH_EXCEPT_H

#include "api_export.h"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace splitbench
{

//! Base class for splitbench exceptions.
class LIBSPLITBENCH_API Exception: public std::runtime_error {
  int ex_code;

public:
  explicit Exception( const std::string& i, int c = -1 ):
    runtime_error( i ), ex_code(c) {}

  virtual int code() const { return ex_code; }
};

//! Line cannot be split into method, resource and version.
class LIBSPLITBENCH_API Malformed_line: public Exception {
public:
  explicit Malformed_line( std::string_view line ):
    Exception("Malformed line '" + sanitize_line(line) + "'", -1) {}

private:
  //! Keep the message printable and short; lines may come from fuzzers.
  static std::string sanitize_line(std::string_view line) {
    constexpr size_t MAX_LINE_LEN = 64;
    std::string result;
    result.reserve(std::min(line.length(), MAX_LINE_LEN));

    for (size_t i = 0; i < line.length() && result.length() < MAX_LINE_LEN; ++i) {
      unsigned char c = static_cast<unsigned char>(line[i]);
      result += (c >= 0x20 && c < 0x7f) ? static_cast<char>(c) : '?';
    }

    if (line.length() > MAX_LINE_LEN) {
      result += "...";
    }
    return result;
  }
};

//! Clock or allocation counter cannot be used on this platform.
class LIBSPLITBENCH_API Probe_unavailable: public Exception {
public:
  explicit Probe_unavailable( const std::string& d ):
    Exception(std::string("Probe unavailable. ") += d, -2) {}
};

//! Probe returned inconsistent readings.
class LIBSPLITBENCH_API Probe_error: public Exception {
public:
  explicit Probe_error( const std::string& d ):
    Exception(std::string("Probe error. ") += d, -3) {}
};

//! Invalid run options.
class LIBSPLITBENCH_API Bad_config: public Exception {
public:
  explicit Bad_config( const std::string& d ):
    Exception(std::string("Bad config. ") += d, -4) {}
};

} // namespace splitbench

#endif
