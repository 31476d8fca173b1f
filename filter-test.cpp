#include "filter.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  std::vector<std::string> const body{
      "Hi there,",
      "",
      "Click here to claim your PRIZE.",
      "Regards",
  };

  CHECK(!message::body_vetoed(body, {}));
  CHECK(!message::body_vetoed({}, {Pattern("x")}));

  {
    std::vector<Pattern> const pats{Pattern("unsubscribe"), Pattern("Regards")};
    auto const hit = message::find_rejected(body, pats);
    CHECK(hit);
    CHECK_EQ(hit->line_no, 3u);
    CHECK_EQ(hit->pattern, &pats[1]);
    CHECK(message::body_vetoed(body, pats));
  }

  // Literals are case-sensitive, regexes only with the i flag.
  CHECK(!message::body_vetoed(body, {Pattern("prize")}));
  CHECK(!message::body_vetoed(body, {Pattern::from_string("/prize/")}));
  CHECK(message::body_vetoed(body, {Pattern::from_string("/prize/i")}));

  // Earliest line wins over earliest pattern.
  {
    std::vector<Pattern> const pats{Pattern("Regards"), Pattern("Hi")};
    auto const hit = message::find_rejected(body, pats);
    CHECK(hit);
    CHECK_EQ(hit->line_no, 0u);
    CHECK_EQ(hit->pattern->as_string(), Pattern("Hi").as_string());
  }

  // Within one line, first pattern in order.
  {
    std::vector<Pattern> const pats{Pattern("claim"), Pattern("Click")};
    auto const hit = message::find_rejected(body, pats);
    CHECK(hit);
    CHECK_EQ(hit->line_no, 2u);
    CHECK_EQ(hit->pattern, &pats[0]);
  }

  // A blank line matches an anchored empty regex; a literal "" is
  // contained in anything.
  {
    auto const hit
        = message::find_rejected(body, {Pattern::from_string("/^$/")});
    CHECK(hit);
    CHECK_EQ(hit->line_no, 1u);
  }
  {
    std::vector<std::string> const long_body{
        "short line",
        "click" + std::string(100'000, '\t') + "here",
    };
    std::vector<Pattern> const pats{Pattern::from_string("/click\\s+here/")};
    auto const hit = message::find_rejected(long_body, pats);
    CHECK(hit);
    CHECK_EQ(hit->line_no, 1u);
  }
  {
    auto const hit = message::find_rejected(body, {Pattern("")});
    CHECK(hit);
    CHECK_EQ(hit->line_no, 0u);
  }
}
