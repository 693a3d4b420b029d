#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace unpack {

  // Base of every error raised while compiling a schema. what() is the
  // rendered diagnostic (see format_diagnostic), reason() the one-line cause.
  class schema_error : public std::runtime_error {
    std::string reason_;
    std::size_t line_;
    std::size_t depth_;

  public:
    schema_error(std::string reason, const std::string& diagnostic,
                 std::size_t line, std::size_t depth)
        : std::runtime_error(diagnostic), reason_(std::move(reason)),
          line_(line), depth_(depth) {}

    const std::string&
    reason() const {
      return reason_;
    }

    std::size_t
    line() const {
      return line_;
    }

    // Open nesting contexts when the error was detected.
    std::size_t
    depth() const {
      return depth_;
    }
  };

  // Unexpected content that no grammar rule matches, or unbalanced nesting.
  class schema_parsing_error : public schema_error {
  public:
    using schema_error::schema_error;
  };

  // A type name that is not in the type registry.
  class unknown_data_type_error : public schema_error {
  public:
    using schema_error::schema_error;
  };

  // An output column (or json path) declared more than once.
  class duplicate_column_error : public schema_error {
  public:
    using schema_error::schema_error;
  };

  // A rename applied to a list or struct, i.e. to part of a json path.
  class path_renaming_error : public schema_error {
  public:
    using schema_error::schema_error;
  };

} // namespace unpack
