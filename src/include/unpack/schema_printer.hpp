#pragma once

#include <unpack/compiled_schema.hpp>
#include <unpack/data_type.hpp>

#include <string>

namespace unpack {

  // Renders a type in the schema grammar, one field per line, nested types
  // indented by four spaces:
  //
  //   attribute: Utf8
  //   nested: Struct(
  //       foo: Float32
  //       vector: List(
  //           UInt8
  //       )
  //   )
  //
  // A struct_type prints its fields at the top level, any other type prints
  // as a lone type.
  std::string
  print_schema(const data_type& type);

  // Same, with the renames of `schema` written back as `name=renamed: Type`.
  std::string
  print_schema(const compiled_schema& schema);

} // namespace unpack
