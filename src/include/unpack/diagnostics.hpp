#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace unpack {

  // Renders the excerpt attached to schema errors:
  //
  //   Tripped on line 2
  //
  //      1   │ headers: Struct(
  //      2   │     timestamp: Foo
  //        ? │                ^^^
  //
  // The issue span runs from the issue start up to the next delimiter,
  // newline or end of source.
  std::string
  format_diagnostic(std::string_view source, std::size_t issue_start);

  // Same, pointing at the first occurrence of `unparsed` in `source`
  // (the start of the source when it cannot be found).
  std::string
  format_diagnostic(std::string_view source, std::string_view unparsed);

  // 1-based line holding `offset`.
  std::size_t
  line_number_at(std::string_view source, std::size_t offset);

} // namespace unpack
