#ifndef PATTERN_DOT_HPP
#define PATTERN_DOT_HPP

#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include <boost/regex.hpp>

// Either a literal string or a compiled regular expression, so the
// rest of the code never has to care which one a config value was.

class Pattern {
public:
  struct regex {
    std::string  source;
    bool         icase{false};
    boost::regex compiled;
  };

  // Literal substring.
  explicit Pattern(std::string_view literal);

  // Perl syntax regex, throws config_error if it won't compile.
  Pattern(std::string_view rx, bool icase);

  // Accepts "/body/flags" as a regex, anything else as a literal.
  static Pattern from_string(std::string_view str);

  // Literal: substring containment.  Regex: search anywhere; throws
  // std::runtime_error if matching gets too expensive.
  bool matches(std::string_view text) const;

  // Literal: equality.  Regex: the whole text must match.
  bool matches_whole(std::string_view text) const;

  bool is_regex() const { return std::holds_alternative<regex>(pat_); }

  std::string as_string() const;

private:
  std::variant<std::string, regex> pat_;
};

inline std::ostream& operator<<(std::ostream& s, Pattern const& p)
{
  return s << p.as_string();
}

#endif // PATTERN_DOT_HPP
