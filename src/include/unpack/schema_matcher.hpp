#pragma once

#include <cstddef>
#include <string_view>

namespace unpack {

  enum class token_kind {
    eof,
    renamed_attribute, // name = new_name : type
    attribute,         // name : type
    lone_type,         // type
    open_delimiter,    // ( [ { <
    close_delimiter,   // ) ] } >
    unexpected,        // nothing matched; text is the remaining source
  };

  // Views into the matched source; empty when the rule has no such part.
  struct token {
    token_kind kind = token_kind::eof;
    std::string_view text;
    std::size_t offset = 0;

    std::string_view name;
    std::size_t name_offset = 0;
    std::string_view new_name;
    std::size_t new_name_offset = 0;
    std::string_view type;
    std::size_t type_offset = 0;
  };

  bool
  is_opening_delimiter(char c);

  bool
  is_closing_delimiter(char c);

  // Splits a schema source into tokens, trying the rules in priority order
  // at the start of the remaining text. Runs of commas, newlines and
  // whitespace between tokens are skipped. The source must outlive the
  // matcher and its tokens.
  class schema_matcher {
  public:
    explicit schema_matcher(std::string_view source) : src_(source), pos_(0) {}

    token
    next();

    std::size_t
    position() const {
      return pos_;
    }

  private:
    std::string_view src_;
    std::size_t pos_;

    std::size_t
    scan_identifier(std::size_t from) const;

    std::size_t
    skip_spaces(std::size_t from) const;

    bool
    match_renamed_attribute(token& tok) const;

    bool
    match_attribute(token& tok) const;

    bool
    match_lone_type(token& tok) const;
  };

} // namespace unpack
