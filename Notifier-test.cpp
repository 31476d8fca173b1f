#include "Notifier.hpp"

#include "Transport.hpp"
#include "message.hpp"

#include <glog/logging.h>

namespace {
bool contains(std::string_view haystack, std::string_view needle)
{
  return haystack.find(needle) != std::string_view::npos;
}
} // namespace

int main(int argc, char* argv[])
{
  auto constexpr original = "Subject: lost\r\n\r\nbody\r\n";

  {
    MemTransport transport;
    Notifier     notifier(transport, "postmaster@yourdomain.com");

    notifier.notify("failed to get mail content", "mail/abc", original);

    CHECK_EQ(transport.sent_msgs.size(), 1u);
    auto const& sent = transport.sent_msgs[0];
    CHECK_EQ(sent.source, "postmaster@yourdomain.com");
    CHECK_EQ(sent.targets.size(), 1u);
    CHECK_EQ(sent.targets[0], "postmaster@yourdomain.com");

    // Must be a message we can parse back.
    message::parsed msg;
    msg.parse(sent.msg);
    CHECK_EQ(msg.get_header(message::To), "<postmaster@yourdomain.com>");
    CHECK_EQ(msg.get_header(message::Subject),
             "mailfwd: failed to process message");
    CHECK(!msg.get_header(message::Date).empty());

    CHECK(contains(sent.msg, "\r\n\r\nError: failed to get mail content\r\n"));
    CHECK(contains(sent.msg, "Location: mail/abc\r\n"));
    CHECK(contains(sent.msg, "Original message:\r\n\r\nSubject: lost\r\n"));
  }

  // Nothing to attach, nowhere it came from.
  {
    MemTransport transport;
    Notifier     notifier(transport, "pm@yourdomain.com");

    auto const text = notifier.compose("bad event", "", "");
    CHECK(contains(text, "Error: bad event\r\n"));
    CHECK(!contains(text, "Location:"));
    CHECK(!contains(text, "Original message:"));
  }

  // No postmaster, no mail.
  {
    MemTransport transport;
    Notifier     notifier(transport, "");
    notifier.notify("whatever", "mail/x", original);
    CHECK(transport.sent_msgs.empty());
  }

  // A transport failure is logged, not thrown.
  {
    MemTransport transport;
    transport.refuse = true;
    Notifier notifier(transport, "pm@yourdomain.com");
    notifier.notify("first problem", "mail/x", original);
    CHECK(transport.sent_msgs.empty());
  }
}
