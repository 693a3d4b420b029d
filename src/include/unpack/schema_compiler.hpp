#pragma once

#include <unpack/compiled_schema.hpp>

#include <string>
#include <string_view>

namespace unpack {

  struct compile_options {
    // Joins the segments of a json path.
    std::string separator = ".";
  };

  // Compiles the schema grammar:
  //
  //   text: Utf8
  //   nested: List(
  //       Struct(
  //           attr: UInt8
  //           attr2=renamed: UInt8
  //       )
  //   )
  //
  // Any of ( [ { < opens a nested type and any of ) ] } > closes it; the
  // families do not have to match. Type names are case-insensitive. Commas,
  // newlines and indentation are ignored.
  //
  // compile() throws a schema_error subclass on the first problem found.
  // It keeps no state between calls.
  class schema_compiler {
    compile_options options_;

  public:
    explicit schema_compiler(compile_options options = {});

    compiled_schema
    compile(std::string_view source) const;
  };

} // namespace unpack
