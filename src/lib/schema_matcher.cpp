#include <unpack/schema_matcher.hpp>

#include <cctype>

namespace unpack {

  namespace {

    bool
    is_identifier_char(char c) {
      return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    bool
    is_insignificant(char c) {
      return c == ',' || std::isspace(static_cast<unsigned char>(c));
    }

  } // namespace

  bool
  is_opening_delimiter(char c) {
    return c == '(' || c == '[' || c == '{' || c == '<';
  }

  bool
  is_closing_delimiter(char c) {
    return c == ')' || c == ']' || c == '}' || c == '>';
  }

  std::size_t
  schema_matcher::scan_identifier(std::size_t from) const {
    while (from < src_.size() && is_identifier_char(src_[from]))
      ++from;
    return from;
  }

  std::size_t
  schema_matcher::skip_spaces(std::size_t from) const {
    while (from < src_.size() &&
           std::isspace(static_cast<unsigned char>(src_[from])))
      ++from;
    return from;
  }

  bool
  schema_matcher::match_renamed_attribute(token& tok) const {
    auto name_end = scan_identifier(pos_);
    if (name_end == pos_) return false;

    auto eq = skip_spaces(name_end);
    if (eq >= src_.size() || src_[eq] != '=') return false;

    auto new_name = skip_spaces(eq + 1);
    auto new_name_end = scan_identifier(new_name);
    if (new_name_end == new_name) return false;

    auto colon = skip_spaces(new_name_end);
    if (colon >= src_.size() || src_[colon] != ':') return false;

    auto type = skip_spaces(colon + 1);
    auto type_end = scan_identifier(type);
    if (type_end == type) return false;

    tok.kind = token_kind::renamed_attribute;
    tok.name = src_.substr(pos_, name_end - pos_);
    tok.name_offset = pos_;
    tok.new_name = src_.substr(new_name, new_name_end - new_name);
    tok.new_name_offset = new_name;
    tok.type = src_.substr(type, type_end - type);
    tok.type_offset = type;
    tok.text = src_.substr(pos_, type_end - pos_);
    return true;
  }

  bool
  schema_matcher::match_attribute(token& tok) const {
    auto name_end = scan_identifier(pos_);
    if (name_end == pos_) return false;

    auto colon = skip_spaces(name_end);
    if (colon >= src_.size() || src_[colon] != ':') return false;

    auto type = skip_spaces(colon + 1);
    auto type_end = scan_identifier(type);
    if (type_end == type) return false;

    tok.kind = token_kind::attribute;
    tok.name = src_.substr(pos_, name_end - pos_);
    tok.name_offset = pos_;
    tok.new_name = tok.name;
    tok.new_name_offset = pos_;
    tok.type = src_.substr(type, type_end - type);
    tok.type_offset = type;
    tok.text = src_.substr(pos_, type_end - pos_);
    return true;
  }

  bool
  schema_matcher::match_lone_type(token& tok) const {
    auto type_end = scan_identifier(pos_);
    if (type_end == pos_) return false;

    tok.kind = token_kind::lone_type;
    tok.type = src_.substr(pos_, type_end - pos_);
    tok.type_offset = pos_;
    tok.text = tok.type;
    return true;
  }

  token
  schema_matcher::next() {
    while (pos_ < src_.size() && is_insignificant(src_[pos_]))
      ++pos_;

    token tok;
    tok.offset = pos_;
    if (pos_ >= src_.size()) return tok;

    char c = src_[pos_];
    bool matched = match_renamed_attribute(tok) || match_attribute(tok) ||
                   match_lone_type(tok);
    if (!matched) {
      if (is_opening_delimiter(c)) {
        tok.kind = token_kind::open_delimiter;
      } else if (is_closing_delimiter(c)) {
        tok.kind = token_kind::close_delimiter;
      } else {
        // Nothing consumed; the caller reports the remaining text
        tok.kind = token_kind::unexpected;
        tok.text = src_.substr(pos_);
        return tok;
      }
      tok.text = src_.substr(pos_, 1);
    }

    pos_ += tok.text.size();
    return tok;
  }

} // namespace unpack
