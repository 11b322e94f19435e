//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef SPLITBENCH_OWNED_TEXT_H
#define SPLITBENCH_OWNED_TEXT_H

#include "api_export.h"

#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

namespace splitbench {

//! Heap-backed copy of a piece of text.
/*! Unlike std::string there is no small-buffer storage: every
    construction from a view performs exactly one heap allocation,
    whatever the length. Move-only. */
class LIBSPLITBENCH_API Owned_text {
  std::unique_ptr<char[]> data_;
  size_t size_;

public:
  Owned_text(): data_(), size_(0) {}
  explicit Owned_text( std::string_view s );

  Owned_text(Owned_text&&) noexcept = default;
  Owned_text& operator=(Owned_text&&) noexcept = default;

  Owned_text(const Owned_text&) = delete;
  Owned_text& operator=(const Owned_text&) = delete;

  const char* data() const { return data_.get(); }
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  std::string_view view() const { return std::string_view(data_.get(), size_); }
  std::string str() const { return std::string(data_.get(), size_); }
};

inline bool operator==(const Owned_text& a, std::string_view b)
{
  return a.view() == b;
}

inline bool operator!=(const Owned_text& a, std::string_view b)
{
  return !(a == b);
}

inline std::ostream& operator<<(std::ostream& os, const Owned_text& t)
{
  return os << t.view();
}

} // namespace splitbench

#endif
