// Fuzz target for the request line splitting strategies
// Every strategy either rejects the line with Malformed_line or yields
// fields consistent with the separators found in it.

#include "libsplitbench/except.h"
#include "libsplitbench/strategies.h"
#include "fuzz_common.h"

#include <cstdint>
#include <initializer_list>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (size > fuzz::MAX_INPUT_SIZE) return 0;

  const std::string input(reinterpret_cast<const char*>(data), size);
  const std::string_view line(input);

  try {
    splitbench::Field_views v = splitbench::Slice_strategy().parse(line);
    splitbench::Separators sep = splitbench::locate_separators(line);

    fuzz::require(fuzz::within(v.method(), line));
    fuzz::require(fuzz::within(v.resource(), line));
    fuzz::require(fuzz::within(v.http_version(), line));

    // method SP resource SP version covers the whole line
    fuzz::require(v.method().size() + v.resource().size() + v.http_version().size() + 2 == size);
    fuzz::require(v.method().find(' ') == std::string_view::npos);
    fuzz::require(v.http_version().find(' ') == std::string_view::npos);
    fuzz::require(line[sep.first] == ' ' && line[sep.last] == ' ');

    splitbench::Owned_fields o = splitbench::Index_substring_strategy().parse(line);
    fuzz::require(o.method() == v.method());
    fuzz::require(o.resource() == v.resource());
    fuzz::require(o.http_version() == v.http_version());
  } catch (const splitbench::Malformed_line&) {
    // Fewer than two spaces
    fuzz::require(line.find(' ') == line.rfind(' '));
  }

  try {
    splitbench::Split_fields s = splitbench::Split_strategy().parse(line);
    fuzz::require(s.token_count() >= 3);
    fuzz::require(!s.method().empty());
    fuzz::require(!s.resource().empty());
    fuzz::require(!s.http_version().empty());

    // Tokens appear in order and never contain whitespace
    size_t pos = 0;
    for (const splitbench::Owned_text* t : {&s.method(), &s.resource(), &s.http_version()}) {
      fuzz::require(!fuzz::has_space(t->view()));
      pos = line.find(t->view(), pos);
      fuzz::require(pos != std::string_view::npos);
      pos += t->size();
    }
  } catch (const splitbench::Malformed_line&) {
    // Expected for lines with fewer than three tokens
  }

  return 0;
}
