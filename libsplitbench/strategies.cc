//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#include "strategies.h"
#include "except.h"

#include <cctype>

namespace splitbench {

namespace {

// Helper: split string by whitespace, compressing consecutive delimiters
template<typename Container>
void split_by_whitespace(Container& result, std::string_view s) {
  result.clear();
  size_t start = 0;
  size_t len = s.size();

  while (start < len) {
    // Skip leading whitespace
    while (start < len && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    if (start >= len) break;

    // Find end of token
    size_t end = start;
    while (end < len && !std::isspace(static_cast<unsigned char>(s[end]))) ++end;

    result.emplace_back(s.substr(start, end - start));
    start = end;
  }
}

} // anonymous namespace

const char* strategy_name(Strategy_kind k)
{
  switch (k) {
  case Strategy_kind::split:
    return "Split";
  case Strategy_kind::index_substring:
    return "Substring";
  case Strategy_kind::slice:
    return "Slice";
  }
  return "Unknown";
}

Separators locate_separators(std::string_view line)
{
  size_t first = line.find(' ');
  size_t last = line.rfind(' ');

  if (first == std::string_view::npos || first == last)
    throw Malformed_line(line);

  return Separators{first, last};
}

// ----------------------------------------------------------------------------
Split_fields Split_strategy::parse(std::string_view line) const
{
  std::vector<Owned_text> tokens;
  split_by_whitespace(tokens, line);

  if (tokens.size() < 3)
    throw Malformed_line(line);

  return Split_fields(std::move(tokens));
}

// ----------------------------------------------------------------------------
Owned_fields Index_substring_strategy::parse(std::string_view line) const
{
  Separators sep = locate_separators(line);

  Owned_text method(line.substr(0, sep.first));
  Owned_text resource(line.substr(sep.first + 1, sep.last - sep.first - 1));
  Owned_text version(line.substr(sep.last + 1));

  return Owned_fields(std::move(method), std::move(resource), std::move(version));
}

// ----------------------------------------------------------------------------
Field_views Slice_strategy::parse(std::string_view line) const
{
  Separators sep = locate_separators(line);

  return Field_views(
    line.substr(0, sep.first),
    line.substr(sep.first + 1, sep.last - sep.first - 1),
    line.substr(sep.last + 1));
}

} // namespace splitbench
