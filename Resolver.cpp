#include "Resolver.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <glog/logging.h>

Resolution Resolver::resolve(std::vector<std::string> const& recipients,
                             std::string_view                subject) const
{
  Resolution res;

  for (auto const& rcpt : recipients) {
    auto const rule = std::find_if(begin(rules_), end(rules_),
                                   [&rcpt](Rule const& r) { return r.matches(rcpt); });
    if (rule == end(rules_)) {
      LOG(INFO) << "<" << rcpt << "> matched no rule";
      continue;
    }

    auto const idx = std::distance(begin(rules_), rule);

    if (auto const why = rule->rejects(rcpt, subject, globals_); why) {
      LOG(INFO) << "<" << rcpt << "> rejected by rule #" << idx << " ("
                << rule->describe() << "): " << *why;
      continue;
    }

    LOG(INFO) << "<" << rcpt << "> matched rule #" << idx << " ("
              << rule->describe() << ")";

    if (res.primary.empty())
      res.primary = rcpt;

    res.allow_all = res.allow_all || rule->allow_all;

    for (auto const& target : rule->recipients) {
      if (std::find(begin(res.targets), end(res.targets), target) ==
          end(res.targets)) {
        res.targets.push_back(target);
      }
    }
  }

  if (res.empty()) {
    LOG(INFO) << "no forwarding targets";
  }
  else {
    LOG(INFO) << "forwarding " << res.primary << " -> ["
              << fmt::format("{}", fmt::join(res.targets, ", ")) << "]";
  }

  return res;
}
