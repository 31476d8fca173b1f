#include "Resolver.hpp"

#include "Config.hpp"

#include <glog/logging.h>
#include <glog/stl_logging.h>

using strings = std::vector<std::string>;

int main(int argc, char* argv[])
{
  auto const cfg = Config::parse(R"({
    "globalRules": { "rejectIfSubjectContains": ["MAKE.MONEY.FAST"] },
    "rules": [
      { "matchHost": "yourdomain.com",
        "rejectUsers": ["bad", "null"],
        "recipients": ["you@team.example.net"] },
      { "matchExact": "buddy@yourotherdomain.org",
        "recipients": ["buddy@team.example.net"] },
      { "matchPattern": "/^(biz|legal)@yourotherdomain\\.org$/i",
        "recipients": ["you@team.example.net", "buddy@team.example.net"] },
      { "matchPattern": "/^(abuse|admin|(web|post|host)master)@.*$/i",
        "allowAll": true,
        "recipients": ["you@team.example.net"] }
    ]
  })");

  Resolver const resolver(cfg.rules, cfg.globals);

  // First recipient rejected by local-part, second accepted.
  {
    auto const res = resolver.resolve(
        {"bad@yourdomain.com", "ok@yourdomain.com"}, "hello");
    CHECK_EQ(res.targets, strings{"you@team.example.net"});
    CHECK_EQ(res.primary, "ok@yourdomain.com");
    CHECK(!res.allow_all);
  }

  // Deterministic: same input, same output.
  {
    strings const rcpts{"biz@yourotherdomain.org", "ok@yourdomain.com",
                        "buddy@yourotherdomain.org"};
    auto const a = resolver.resolve(rcpts, "quarterly");
    auto const b = resolver.resolve(rcpts, "quarterly");
    CHECK_EQ(a.targets, b.targets);
    CHECK_EQ(a.primary, b.primary);
  }

  // Dedup in first-seen order across rules.
  {
    auto const res =
        resolver.resolve({"buddy@yourotherdomain.org", "ok@yourdomain.com",
                          "LEGAL@yourotherdomain.org"},
                         "hi");
    CHECK_EQ(res.targets,
             (strings{"buddy@team.example.net", "you@team.example.net"}));
    CHECK_EQ(res.primary, "buddy@yourotherdomain.org");
  }

  // Primary is the first accepted recipient, not the first one seen.
  {
    auto const res = resolver.resolve(
        {"nobody@elsewhere.example", "null@yourdomain.com",
         "biz@yourotherdomain.org", "ok@yourdomain.com"},
        "hi");
    CHECK_EQ(res.primary, "biz@yourotherdomain.org");
    CHECK_EQ(res.targets,
             (strings{"you@team.example.net", "buddy@team.example.net"}));
  }

  // No rule matches: empty, and not an error.
  {
    auto const res =
        resolver.resolve({"someone@elsewhere.example", "x@y.z"}, "hi");
    CHECK(res.empty());
    CHECK(res.primary.empty());
  }

  // Global subject reject, unless allowAll.
  {
    auto const res = resolver.resolve(
        {"ok@yourdomain.com", "postmaster@yourdomain.com"}, "MAKE.MONEY.FAST");
    // postmaster@yourdomain.com hits the host rule first, which rejects.
    CHECK(res.empty());

    auto const res2 = resolver.resolve(
        {"ok@yourdomain.com", "postmaster@elsewhere.example"},
        "MAKE.MONEY.FAST");
    CHECK_EQ(res2.targets, strings{"you@team.example.net"});
    CHECK_EQ(res2.primary, "postmaster@elsewhere.example");
    CHECK(res2.allow_all);
  }

  // First match wins, even when it rejects: rule 0 matches and rejects,
  // rule 1 would accept, the recipient still gets nothing.
  {
    auto const prec = Config::parse(R"({
      "rules": [
        { "matchHost": "example.com", "rejectUsers": ["sales"],
          "recipients": ["first@team.example.net"] },
        { "matchExact": "sales@example.com",
          "recipients": ["second@team.example.net"] }
      ]
    })");
    Resolver const r(prec.rules, prec.globals);

    auto const res = r.resolve({"sales@example.com"}, "");
    CHECK(res.empty());
    CHECK(res.primary.empty());

    auto const res2 = r.resolve({"sales@example.com", "info@example.com"}, "");
    CHECK_EQ(res2.targets, strings{"first@team.example.net"});
    CHECK_EQ(res2.primary, "info@example.com");
  }

  // Target dedup is case-sensitive string equality.
  {
    auto const ci = Config::parse(R"({
      "rules": [
        { "matchExact": "a@example.com", "recipients": ["Box@team.example.net"] },
        { "matchExact": "b@example.com", "recipients": ["box@team.example.net",
                                                        "Box@team.example.net"] }
      ]
    })");
    Resolver const r(ci.rules, ci.globals);
    auto const res = r.resolve({"a@example.com", "b@example.com"}, "");
    CHECK_EQ(res.targets,
             (strings{"Box@team.example.net", "box@team.example.net"}));
  }
}
