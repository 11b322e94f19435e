//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#include "owned_text.h"

#include <cstring>

namespace splitbench {

Owned_text::Owned_text( std::string_view s ):
  data_(new char[s.size()]),
  size_(s.size())
{
  if (size_)
    std::memcpy(data_.get(), s.data(), size_);
}

} // namespace splitbench
