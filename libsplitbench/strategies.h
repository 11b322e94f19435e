//  Splitbench - request line splitting micro-benchmarks.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef SPLITBENCH_STRATEGIES_H
#define SPLITBENCH_STRATEGIES_H

#include "api_export.h"
#include "owned_text.h"

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace splitbench {

//! Request line every benchmark run parses.
constexpr std::string_view reference_line = "GET /css/styles.css HTTP/1.1";

//! Fixed, closed set of splitting strategies, in benchmark order.
enum class Strategy_kind {
  split,
  index_substring,
  slice
};

constexpr size_t strategy_count = 3;

LIBSPLITBENCH_API const char* strategy_name(Strategy_kind);

//! Tokens produced by Split_strategy.
class LIBSPLITBENCH_API Split_fields {
  std::vector<Owned_text> tokens_;

public:
  explicit Split_fields(std::vector<Owned_text>&& tokens):
    tokens_(std::move(tokens)) {}

  const Owned_text& method() const { return tokens_[0]; }
  const Owned_text& resource() const { return tokens_[1]; }
  const Owned_text& http_version() const { return tokens_[2]; }

  size_t token_count() const { return tokens_.size(); }
};

//! Three independently allocated copies.
class LIBSPLITBENCH_API Owned_fields {
  Owned_text method_;
  Owned_text resource_;
  Owned_text version_;

public:
  Owned_fields(Owned_text&& m, Owned_text&& r, Owned_text&& v):
    method_(std::move(m)), resource_(std::move(r)), version_(std::move(v)) {}

  const Owned_text& method() const { return method_; }
  const Owned_text& resource() const { return resource_; }
  const Owned_text& http_version() const { return version_; }
};

//! Non-owning slices of the parsed line.
/*! Valid only while the parsed line is alive. Never store these
    beyond the iteration that produced them. */
class LIBSPLITBENCH_API Field_views {
  std::string_view method_;
  std::string_view resource_;
  std::string_view version_;

public:
  Field_views(std::string_view m, std::string_view r, std::string_view v):
    method_(m), resource_(r), version_(v) {}

  std::string_view method() const { return method_; }
  std::string_view resource() const { return resource_; }
  std::string_view http_version() const { return version_; }
};

//! Tokenizes on whitespace into a vector of owned tokens.
/*! Consecutive whitespace is compressed. Throws Malformed_line
    when fewer than three tokens are found; extra tokens are kept
    but ignored. */
class LIBSPLITBENCH_API Split_strategy {
public:
  typedef Split_fields Fields;
  static constexpr Strategy_kind kind = Strategy_kind::split;

  Split_fields parse(std::string_view line) const;
};

//! Locates the first and the last space and copies each field.
class LIBSPLITBENCH_API Index_substring_strategy {
public:
  typedef Owned_fields Fields;
  static constexpr Strategy_kind kind = Strategy_kind::index_substring;

  Owned_fields parse(std::string_view line) const;
};

//! Locates the first and the last space and slices the line in place.
class LIBSPLITBENCH_API Slice_strategy {
public:
  typedef Field_views Fields;
  static constexpr Strategy_kind kind = Strategy_kind::slice;

  Field_views parse(std::string_view line) const;

  //! Slicing a temporary string would leave the views dangling.
  template <class T, class = std::enable_if_t<
    std::is_same_v<std::decay_t<T>, std::string> && !std::is_lvalue_reference_v<T>>>
  Field_views parse(T&&) const = delete;
};

//! Positions of the separators around the resource field.
struct Separators {
  size_t first;
  size_t last;
};

//! Finds the first and the last space of a request line.
/*! Throws Malformed_line unless the line holds at least two
    distinct spaces. */
LIBSPLITBENCH_API Separators locate_separators(std::string_view line);

} // namespace splitbench

#endif
