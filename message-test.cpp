#include "message.hpp"

#include "errors.hpp"

#include <string>

#include <glog/logging.h>
#include <glog/stl_logging.h>

using strings = std::vector<std::string>;

namespace {
bool parse_fails(std::string_view input)
{
  message::parsed msg;
  try {
    msg.parse(input);
  }
  catch (malformed_message const& e) {
    LOG(INFO) << e.what();
    return true;
  }
  return false;
}
} // namespace

int main(int argc, char* argv[])
{
  auto constexpr input = "Received: from a by b;\r\n"
                         "\tTue, 1 Jan 2030 00:00:00 +0000\r\n"
                         "From: \"Alice\" <alice@example.org>\r\n"
                         "To: ok@yourdomain.com\r\n"
                         "Subject:Hello\r\n"
                         "X-Empty:\r\n"
                         "\r\n"
                         "Line one\r\n"
                         "\r\n"
                         "  indented, still body\r\n";

  message::parsed msg;
  msg.parse(input);

  CHECK(msg.separator_found);
  CHECK_EQ(msg.eol, "\r\n");
  CHECK_EQ(msg.headers.size(), 5u);

  auto const& rcvd = msg.headers[0];
  CHECK_EQ(rcvd.name, "Received");
  CHECK_EQ(rcvd.value, "from a by b; Tue, 1 Jan 2030 00:00:00 +0000");
  CHECK_EQ(rcvd.raw_lines,
           (strings{"Received: from a by b;", "\tTue, 1 Jan 2030 00:00:00 +0000"}));

  CHECK_EQ(msg.headers[1].name, "From");
  CHECK_EQ(msg.headers[1].value, "\"Alice\" <alice@example.org>");
  CHECK_EQ(msg.headers[3].value, "Hello"); // no space after the colon
  CHECK_EQ(msg.headers[4].value, "");

  CHECK_EQ(msg.get_header("subject"), "Hello");
  CHECK_EQ(msg.get_header("cc"), "");

  CHECK_EQ(msg.body, (strings{"Line one", "", "  indented, still body", ""}));

  // Putting it back together gives the same bytes.
  strings lines;
  for (auto const& h : msg.headers)
    lines.insert(end(lines), begin(h.raw_lines), end(h.raw_lines));
  CHECK_EQ(message::reassemble(lines, msg.body, msg.eol), input);

  // Bare LF in, bare LF out.
  {
    auto constexpr lf = "From: a@example.org\nSubject: x\n\nbody\n";
    message::parsed m;
    m.parse(lf);
    CHECK_EQ(m.eol, "\n");
    CHECK_EQ(m.headers.size(), 2u);
    CHECK_EQ(message::reassemble({"From: a@example.org", "Subject: x"}, m.body,
                                 m.eol),
             lf);
  }

  // Headers only, no separator: fine, body is empty.
  {
    message::parsed m;
    m.parse("From: a@example.org\r\nSubject: x");
    CHECK(!m.separator_found);
    CHECK_EQ(m.headers.size(), 2u);
    CHECK(m.body.empty());
    CHECK_EQ(message::reassemble({"From: a@example.org"}, m.body, m.eol),
             "From: a@example.org\r\n\r\n");
  }

  // Multiple continuation lines, spaces and tabs.
  {
    message::parsed m;
    m.parse("DKIM-Signature: v=1;\r\n  a=rsa-sha256;\r\n\tb=abc\r\n\r\n");
    CHECK_EQ(m.headers.size(), 1u);
    CHECK_EQ(m.headers[0].value, "v=1; a=rsa-sha256; b=abc");
    CHECK_EQ(m.headers[0].raw_lines.size(), 3u);
  }

  // Parsing again starts from scratch.
  {
    message::parsed m;
    m.parse("A: 1\r\n\r\nx");
    m.parse("B: 2\r\n\r\ny");
    CHECK_EQ(m.headers.size(), 1u);
    CHECK_EQ(m.headers[0].name, "B");
    CHECK_EQ(m.body, strings{"y"});
  }

  CHECK(parse_fails(" leading continuation: x\r\n\r\nbody"));
  CHECK(parse_fails("\r\nbody without headers"));
  CHECK(parse_fails(""));
  CHECK(parse_fails("no colon here\r\n\r\n"));
  CHECK(parse_fails("From: a\r\nbad header\r\n\r\n"));
  CHECK(parse_fails(": empty name\r\n\r\n"));
  CHECK(parse_fails("Bad Name: x\r\n\r\n"));
  CHECK(!parse_fails("X-Odd_Name!: x\r\n\r\n"));

  // A bare LF or CR inside a CRLF header block would smuggle a new
  // field into anything that copies the value.
  CHECK(parse_fails("From: evil\nBcc: victim@else.example\r\n"
                    "Subject: s\r\n\r\n"));
  CHECK(parse_fails("Subject: s\r\nFrom: evil\rBcc: x@y\r\n\r\n"));
  CHECK(parse_fails("From: a@example.org\r\n"
                    " more\nBcc: x@y\r\n\r\n"));
  // In LF mode a stray CR is just as bad.
  CHECK(parse_fails("From: evil\rBcc: x@y\nSubject: s\n\nbody\n"));
  // The body is left alone.
  CHECK(!parse_fails("Subject: s\r\n\r\nline\nwith bare LF\r\n"));

  message::rewritten r;
  r.header_lines = {"From: \"x\" <ok@yourdomain.com>", "Subject: s"};
  r.body         = {"hi", ""};
  CHECK_EQ(r.as_string(),
           "From: \"x\" <ok@yourdomain.com>\r\nSubject: s\r\n\r\nhi\r\n");

  // Field names compare without case, and only whole names.
  message::header const hdr("rEpLy-tO", "a@example.com",
                            {"rEpLy-tO: a@example.com"});
  CHECK(hdr == message::Reply_To);
  CHECK(!(hdr == message::From));
  CHECK(!(hdr == "Reply-To-Not"));
}
