#include "esc.hpp"

#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  auto const s0 = "\a\xa0\b\t\n\v\f\r\\";
  CHECK_EQ(esc(s0), "\\a\\xa0\\b\\t\\n\\v\\f\\r\\\\");

  auto const s1 = "no characters to escape";
  CHECK_EQ(esc(s1), s1);

  CHECK_EQ(esc("From: a\r\n\tb"), "From: a\\r\\n\\tb");

  CHECK_EQ(esc("0123456789", 4), "0123...(6 more octets)");
  CHECK_EQ(esc("ab\r\n", 3), "ab\\r...(1 more octets)");
  CHECK_EQ(esc("short", 40), "short");
}
