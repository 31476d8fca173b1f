#ifndef RESOLVER_DOT_HPP
#define RESOLVER_DOT_HPP

#include <string>
#include <string_view>
#include <vector>

#include "Rule.hpp"

struct Resolution {
  // Deduplicated, in order of first addition.
  std::vector<std::string> targets;

  // First original recipient that resolved to a non-rejected rule, or empty.
  std::string primary;

  // Some rule that accepted a recipient has allow_all set, so the
  // global body rejects don't apply either.
  bool allow_all{false};

  bool empty() const { return targets.empty(); }
};

class Resolver {
public:
  Resolver(std::vector<Rule> const& rules, GlobalRejects const& globals)
    : rules_(rules)
    , globals_(globals)
  {
  }

  // Recipients are taken in order; for each one the first rule that
  // matches decides, even when that rule rejects.  An empty result is
  // not an error, the message just bounces.
  Resolution resolve(std::vector<std::string> const& recipients,
                     std::string_view                subject) const;

private:
  std::vector<Rule> const& rules_;
  GlobalRejects const&     globals_;
};

#endif // RESOLVER_DOT_HPP
