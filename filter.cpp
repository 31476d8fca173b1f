#include "filter.hpp"

#include "esc.hpp"

#include <glog/logging.h>

namespace message {

std::optional<body_match> find_rejected(std::vector<std::string> const& body,
                                        std::vector<Pattern> const& patterns)
{
  for (size_t n = 0; n < body.size(); ++n) {
    for (auto const& pat : patterns) {
      if (pat.matches(body[n]))
        return body_match{n, &pat};
    }
  }
  return {};
}

bool body_vetoed(std::vector<std::string> const& body,
                 std::vector<Pattern> const&     patterns)
{
  if (auto const hit = find_rejected(body, patterns); hit) {
    LOG(INFO) << "body line " << hit->line_no + 1 << " «"
              << esc(body[hit->line_no]) << "» matches "
              << hit->pattern->as_string();
    return true;
  }
  return false;
}

} // namespace message
