#include "Pattern.hpp"

#include "errors.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  Pattern const lit("MAKE.MONEY.FAST");
  CHECK(!lit.is_regex());
  CHECK(lit.matches("Re: MAKE.MONEY.FAST now"));
  CHECK(!lit.matches("MAKE MONEY FAST")); // '.' is literal here
  CHECK(!lit.matches("make.money.fast")); // and so is case
  CHECK(lit.matches_whole("MAKE.MONEY.FAST"));
  CHECK(!lit.matches_whole("xMAKE.MONEY.FAST"));
  CHECK_EQ(lit.as_string(), "\"MAKE.MONEY.FAST\"");

  Pattern const rx("^(biz|legal)@example\\.org$", true);
  CHECK(rx.is_regex());
  CHECK(rx.matches("BIZ@example.org"));
  CHECK(rx.matches_whole("legal@Example.ORG"));
  CHECK(!rx.matches("biz@example.org.evil"));
  CHECK_EQ(rx.as_string(), "/^(biz|legal)@example\\.org$/i");

  // search vs whole-string
  Pattern const part("master@", false);
  CHECK(part.matches("postmaster@example.org"));
  CHECK(!part.matches_whole("postmaster@example.org"));

  auto const from_slashes = Pattern::from_string("/^(abuse|admin)@.*/i");
  CHECK(from_slashes.is_regex());
  CHECK(from_slashes.matches_whole("Abuse@example.com"));

  auto const no_flags = Pattern::from_string("/v[i1]agra/");
  CHECK(no_flags.is_regex());
  CHECK(no_flags.matches("cheap v1agra here"));
  CHECK(!no_flags.matches("cheap V1AGRA here"));

  // Not a regex: unknown flag, or a lone slash.
  CHECK(!Pattern::from_string("/a/b/x").is_regex());
  CHECK(!Pattern::from_string("/").is_regex());
  CHECK(!Pattern::from_string("a/b").is_regex());
  CHECK(Pattern::from_string("/usr/bin").matches("see /usr/bin/env"));

  // Long runs for a repeat don't eat the stack.
  {
    auto const click = Pattern::from_string("/click\\s+here/i");
    auto const gap   = std::string(150'000, ' ');
    CHECK(click.matches("Click" + gap + "HERE now"));
    CHECK(!click.matches("click" + gap + "there"));
    auto const run = std::string(150'000, 'a');
    CHECK(Pattern::from_string("/a+/").matches_whole(run));
  }

  auto threw = false;
  try {
    Pattern bad("(unclosed", false);
  }
  catch (config_error const& e) {
    threw = true;
  }
  CHECK(threw);
}
