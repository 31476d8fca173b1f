#ifndef FILTER_DOT_HPP
#define FILTER_DOT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "Pattern.hpp"

namespace message {

struct body_match {
  size_t         line_no;
  Pattern const* pattern;
};

// First body line hitting any of the patterns, lines in order and
// patterns in order within a line.
std::optional<body_match> find_rejected(std::vector<std::string> const& body,
                                        std::vector<Pattern> const& patterns);

// True when the body must not be sent.
bool body_vetoed(std::vector<std::string> const& body,
                 std::vector<Pattern> const&     patterns);

} // namespace message

#endif // FILTER_DOT_HPP
