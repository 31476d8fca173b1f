#include "Rule.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  CHECK_EQ(address::local_part("bad@example.com"), "bad");
  CHECK_EQ(address::domain("bad@example.com"), "example.com");
  CHECK_EQ(address::local_part("\"a@b\"@example.com"), "\"a@b\"");
  CHECK_EQ(address::domain("\"a@b\"@example.com"), "example.com");
  CHECK_EQ(address::local_part("postmaster"), "postmaster");
  CHECK(address::domain("postmaster").empty());

  GlobalRejects globals;
  globals.subject.emplace_back("MAKE.MONEY.FAST");

  Rule host;
  host.match        = Rule::host{"example.com"};
  host.reject_users = {"bad", "null"};
  host.recipients   = {"you@team.example.net"};

  CHECK(host.matches("ok@example.com"));
  CHECK(host.matches("ok@EXAMPLE.com"));
  CHECK(!host.matches("ok@example.com.au"));
  CHECK(!host.matches("ok@sub.example.com"));
  CHECK(!host.matches("example.com"));

  CHECK(!host.rejects("ok@example.com", "hello", globals));
  CHECK(host.rejects("bad@example.com", "hello", globals));
  CHECK(host.rejects("BAD@example.com", "hello", globals)); // local-part folded
  CHECK(host.rejects("null@example.com", "hello", globals));
  CHECK(!host.rejects("badder@example.com", "hello", globals));

  // global subject rejects apply to every rule
  CHECK(host.rejects("ok@example.com", "MAKE.MONEY.FAST!!", globals));

  Rule exact;
  exact.match      = Rule::exact{"buddy@example.org"};
  exact.recipients = {"buddy@team.example.net"};
  CHECK(exact.matches("buddy@example.org"));
  CHECK(!exact.matches("Buddy@example.org"));
  CHECK(!exact.matches("buddy@example.org "));

  Rule pat;
  pat.match          = Pattern("(biz|legal)@example\\.org", true);
  pat.reject_pattern = Pattern("^legal@", false);
  pat.reject_subject.emplace_back(Pattern("unsubscribe", true));
  pat.recipients = {"you@team.example.net"};
  CHECK(pat.matches("BIZ@example.org"));
  CHECK(!pat.matches("xbiz@example.org")); // whole address must match
  CHECK(!pat.rejects("biz@example.org", "quarterly", globals));
  CHECK(pat.rejects("legal@example.org", "quarterly", globals));
  CHECK(pat.rejects("biz@example.org", "Please UNSUBSCRIBE me", globals));

  Rule all;
  all.match        = Pattern("(abuse|admin|(web|post|host)master)@.*", true);
  all.reject_users = {"abuse"};
  all.allow_all    = true;
  all.recipients   = {"you@team.example.net"};
  CHECK(all.matches("postmaster@anything.example"));
  CHECK(!all.rejects("abuse@anything.example", "MAKE.MONEY.FAST", globals));

  CHECK_EQ(host.describe(), "host example.com");
  CHECK_EQ(exact.describe(), "exact <buddy@example.org>");
  CHECK_EQ(pat.describe(), "pattern /(biz|legal)@example\\.org/i");
}
