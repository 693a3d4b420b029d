#include <unpack/diagnostics.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace unpack {

  namespace {

    bool
    ends_issue(char c) {
      switch (c) {
        case '(':
        case ')':
        case '[':
        case ']':
        case '{':
        case '}':
        case '<':
        case '>':
        case '\n':
          return true;
        default:
          return false;
      }
    }

  } // namespace

  std::size_t
  line_number_at(std::string_view source, std::size_t offset) {
    offset = std::min(offset, source.size());
    return static_cast<std::size_t>(
               std::count(source.begin(), source.begin() + offset, '\n')) +
           1;
  }

  std::string
  format_diagnostic(std::string_view source, std::size_t issue_start) {
    issue_start = std::min(issue_start, source.size());

    // Span of the issue
    std::size_t issue_end = issue_start;
    while (issue_end < source.size() && !ends_issue(source[issue_end]))
      ++issue_end;
    // A stray delimiter still gets one caret
    if (issue_end == issue_start && issue_start < source.size() &&
        source[issue_start] != '\n')
      ++issue_end;

    // Span of the enclosing line
    auto before = source.substr(0, issue_start).rfind('\n');
    std::size_t line_start = before == std::string_view::npos ? 0 : before + 1;
    auto after = source.find('\n', issue_end);
    std::size_t line_end = after == std::string_view::npos ? source.size()
                                                           : after;

    std::ostringstream os;
    os << "Tripped on line " << line_number_at(source, issue_start) << "\n\n";

    std::size_t number = 1;
    std::size_t pos = 0;
    while (true) {
      auto eol = source.find('\n', pos);
      auto stop = std::min(eol, line_end);
      os << "   " << std::left << std::setw(3) << number << " │ "
         << source.substr(pos, stop - pos) << '\n';
      if (eol == std::string_view::npos || eol >= line_end) break;
      pos = eol + 1;
      ++number;
    }

    os << "     ? │ " << std::string(issue_start - line_start, ' ')
       << std::string(issue_end - issue_start, '^') << '\n';

    return os.str();
  }

  std::string
  format_diagnostic(std::string_view source, std::string_view unparsed) {
    auto found = unparsed.empty() ? std::string_view::npos
                                  : source.find(unparsed);
    return format_diagnostic(source, found == std::string_view::npos
                                         ? std::size_t{0}
                                         : found);
  }

} // namespace unpack
