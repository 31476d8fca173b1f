#include "rewrite.hpp"

#include <algorithm>
#include <string>

#include <glog/logging.h>
#include <glog/stl_logging.h>

using strings = std::vector<std::string>;

namespace {
strings rewrite(char const* input, char const* primary = "ok@yourdomain.com")
{
  message::parsed msg;
  msg.parse(input);
  return message::rewrite_headers(msg, primary);
}

long count_prefix(strings const& lines, std::string_view prefix)
{
  return std::count_if(begin(lines), end(lines), [prefix](auto const& l) {
    return std::string_view(l).substr(0, prefix.size()) == prefix;
  });
}
} // namespace

int main(int argc, char* argv[])
{
  CHECK_EQ(message::sanitize_display("\"A > B\" <x@y>"), "A ) B (x@y)");
  CHECK_EQ(message::sanitize_display("plain@example.org"), "plain@example.org");
  CHECK_EQ(message::sanitize_display(""), "");

  // The works: excluded, duplicate, folded, From and Reply-To injection.
  {
    auto const out = rewrite("Return-Path: <bounce@example.org>\r\n"
                             "Received: from a by b;\r\n"
                             "\tTue, 1 Jan 2030 00:00:00 +0000\r\n"
                             "Received: from c by d\r\n"
                             "DKIM-Signature: v=1; a=rsa-sha256;\r\n"
                             "  b=abcdef\r\n"
                             "Sender: list@example.org\r\n"
                             "From: \"A > B\" <x@y>\r\n"
                             "Subject: first\r\n"
                             "subject: second\r\n"
                             "To: ok@yourdomain.com\r\n"
                             "\r\n"
                             "body\r\n");

    CHECK_EQ(out, (strings{
                      "Received: from a by b;",
                      "\tTue, 1 Jan 2030 00:00:00 +0000",
                      "Received: from c by d",
                      "From: \"A ) B (x@y)\" <ok@yourdomain.com>",
                      "Subject: first",
                      "To: ok@yourdomain.com",
                      "Reply-To: \"A > B\" <x@y>",
                  }));
  }

  // An existing, non-empty Reply-To is kept as is and nothing is added.
  {
    auto const out = rewrite("From: alice@example.org\r\n"
                             "Reply-To: list@example.org\r\n"
                             "Subject: s\r\n"
                             "\r\n");
    CHECK_EQ(count_prefix(out, "Reply-To:"), 1);
    CHECK_EQ(out[1], "Reply-To: list@example.org");
    CHECK_EQ(out.back(), "Subject: s");
  }

  // Header names compare without case.
  {
    auto const out = rewrite("FROM: alice@example.org\r\n"
                             "reply-to: list@example.org\r\n"
                             "RETURN-PATH: <x@y>\r\n"
                             "dkim-signature: v=1\r\n"
                             "SENDER: s@example.org\r\n"
                             "\r\n");
    CHECK_EQ(out, (strings{"From: \"alice@example.org\" <ok@yourdomain.com>",
                           "reply-to: list@example.org"}));
  }

  // Empty Reply-To is dropped and replaced by one from From.
  {
    auto const out = rewrite("Reply-To:   \r\n"
                             "From: \"Bob\" <bob@example.org>\r\n"
                             "\r\n");
    CHECK_EQ(out, (strings{"From: \"Bob (bob@example.org)\" <ok@yourdomain.com>",
                           "Reply-To: \"Bob\" <bob@example.org>"}));
  }

  // An empty Reply-To doesn't count as seen; a later real one survives.
  {
    auto const out = rewrite("Reply-To:\r\n"
                             "From: bob@example.org\r\n"
                             "Reply-To: real@example.org\r\n"
                             "Reply-To: dup@example.org\r\n"
                             "\r\n");
    CHECK_EQ(out, (strings{"From: \"bob@example.org\" <ok@yourdomain.com>",
                           "Reply-To: real@example.org"}));
  }

  // No From: nothing to point Reply-To at, the message still goes.
  {
    auto const out = rewrite("Subject: orphan\r\n\r\n");
    CHECK_EQ(out, strings{"Subject: orphan"});
  }

  // Only the first From is used.
  {
    auto const out = rewrite("From: first@example.org\r\n"
                             "From: second@example.org\r\n"
                             "\r\n");
    CHECK_EQ(count_prefix(out, "From:"), 1);
    CHECK_EQ(out.back(), "Reply-To: first@example.org");
  }

  // Folded From: Reply-To gets the unfolded value.
  {
    auto const out = rewrite("From: \"Very Long Name\"\r\n"
                             " <long@example.org>\r\n"
                             "\r\n");
    CHECK_EQ(out, (strings{
                      "From: \"Very Long Name (long@example.org)\" "
                      "<ok@yourdomain.com>",
                      "Reply-To: \"Very Long Name\" <long@example.org>",
                  }));
  }

  // Reassembled, a clean message only differs in From.
  {
    auto constexpr input = "Date: Tue, 1 Jan 2030 00:00:00 +0000\r\n"
                           "From: alice@example.org\r\n"
                           "Reply-To: alice@example.org\r\n"
                           "Subject: hi\r\n"
                           "\r\n"
                           "Hello.\r\n"
                           "\r\n"
                           "-- \r\n"
                           "Alice\r\n";
    message::parsed msg;
    msg.parse(input);
    auto const out = message::reassemble(
        message::rewrite_headers(msg, "ok@yourdomain.com"), msg.body, msg.eol);

    std::string expected = input;
    std::string const old_from = "From: alice@example.org";
    expected.replace(expected.find(old_from), old_from.size(),
                     "From: \"alice@example.org\" <ok@yourdomain.com>");
    CHECK_EQ(out, expected);
  }
}
