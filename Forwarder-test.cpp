#include "Forwarder.hpp"

#include "Notifier.hpp"
#include "Store.hpp"
#include "Transport.hpp"
#include "errors.hpp"

#include <cstring>
#include <memory>

#include <glog/logging.h>
#include <glog/stl_logging.h>

#include <json/reader.h>
#include <json/value.h>

#include <fmt/format.h>

using strings = std::vector<std::string>;

namespace {
auto constexpr config_json = R"({
  "postmaster": "pm@team.example.net",
  "storePrefix": "mail/",
  "globalRules": {
    "rejectIfSubjectContains": ["MAKE MONEY FAST"],
    "rejectIfBodyContains": ["/click\\s+here/i"]
  },
  "rules": [
    { "matchHost": "example.com",
      "rejectUsers": ["bad"],
      "recipients": ["you@team.example.net"] },
    { "matchExact": "abuse@example.org",
      "allowAll": true,
      "recipients": ["you@team.example.net"] }
  ]
})";

auto constexpr clean_msg = "Received: from mx by relay\r\n"
                           "From: \"Alice\" <alice@example.net>\r\n"
                           "Subject: hi\r\n"
                           "DKIM-Signature: v=1; b=xyz\r\n"
                           "\r\n"
                           "Hello.\r\n";

auto constexpr spam_msg = "From: spammer@example.net\r\n"
                          "Subject: deal\r\n"
                          "\r\n"
                          "Please CLICK  here now.\r\n";

bool contains(std::string_view haystack, std::string_view needle)
{
  return haystack.find(needle) != std::string_view::npos;
}

// One forwarder and its in-memory collaborators.  Postmaster notices
// go out a separate transport so a refused forward still shows them.
struct harness {
  harness()
    : config(Config::parse(config_json))
    , notifier(notices, config.postmaster)
    , fwd(config, store, transport, notifier)
  {
  }

  Envelope env(std::string id, strings rcpts, std::string subject = "hi")
  {
    return Envelope{std::move(id), std::move(rcpts), std::move(subject)};
  }

  Config       config;
  MemStore     store;
  MemTransport transport;
  MemTransport notices;
  Notifier     notifier;
  Forwarder    fwd;
};
} // namespace

int main(int argc, char* argv[])
{
  CHECK_EQ(std::string_view(as_string(Disposition::continue_)), "CONTINUE");
  CHECK_EQ(std::string_view(as_string(Disposition::stop_rule)), "STOP_RULE");

  // Nobody to send to: no fetch, let it bounce.
  {
    harness h;
    h.store.put("mail/m0", clean_msg);
    auto const d = h.fwd.handle(h.env("m0", {"bad@example.com", "x@nowhere.test"}));
    CHECK(d == Disposition::continue_);
    CHECK_EQ(h.store.fetches(), 0);
    CHECK(h.transport.sent_msgs.empty());
  }

  // Subject rejected for everyone.
  {
    harness h;
    h.store.put("mail/m1", clean_msg);
    auto const d = h.fwd.handle(
        h.env("m1", {"ok@example.com"}, "how to MAKE MONEY FAST today"));
    CHECK(d == Disposition::continue_);
    CHECK_EQ(h.store.fetches(), 0);
  }

  // The normal case.
  {
    harness h;
    h.store.put("mail/m2", clean_msg);
    auto const d
        = h.fwd.handle(h.env("m2", {"bad@example.com", "ok@example.com"}));
    CHECK(d == Disposition::stop_rule);
    CHECK_EQ(h.store.fetches(), 1);
    CHECK_EQ(h.transport.sent_msgs.size(), 1u);
    CHECK(h.notices.sent_msgs.empty());

    auto const& sent = h.transport.sent_msgs[0];
    CHECK_EQ(sent.targets, strings{"you@team.example.net"});
    CHECK_EQ(sent.source, "ok@example.com");
    CHECK_EQ(sent.msg, "Received: from mx by relay\r\n"
                       "From: \"Alice (alice@example.net)\" <ok@example.com>\r\n"
                       "Subject: hi\r\n"
                       "Reply-To: \"Alice\" <alice@example.net>\r\n"
                       "\r\n"
                       "Hello.\r\n");
  }

  // Body veto: fetched, not sent, not an error.
  {
    harness h;
    h.store.put("mail/m3", spam_msg);
    auto const d = h.fwd.handle(h.env("m3", {"ok@example.com"}));
    CHECK(d == Disposition::continue_);
    CHECK_EQ(h.store.fetches(), 1);
    CHECK(h.transport.sent_msgs.empty());
    CHECK(h.notices.sent_msgs.empty());
  }

  // A very long body line is matched without running out of stack.
  {
    harness h;
    auto const msg = fmt::format("From: a@example.net\r\n\r\n"
                                 "click{}here\r\n",
                                 std::string(200'000, ' '));
    h.store.put("mail/long", msg);
    auto const d = h.fwd.handle(h.env("long", {"ok@example.com"}));
    CHECK(d == Disposition::continue_);
    CHECK(h.transport.sent_msgs.empty());
    CHECK(h.notices.sent_msgs.empty());
  }

  // allowAll skips the body filter.
  {
    harness h;
    h.store.put("mail/m4", spam_msg);
    auto const d = h.fwd.handle(h.env("m4", {"abuse@example.org"}));
    CHECK(d == Disposition::stop_rule);
    CHECK_EQ(h.transport.sent_msgs.size(), 1u);
    CHECK(contains(h.transport.sent_msgs[0].msg, "CLICK  here"));
  }

  // Nothing in the store: postmaster hears about it.
  {
    harness h;
    auto const d = h.fwd.handle(h.env("gone", {"ok@example.com"}));
    CHECK(d == Disposition::stop_rule);
    CHECK(h.transport.sent_msgs.empty());
    CHECK_EQ(h.notices.sent_msgs.size(), 1u);
    auto const& note = h.notices.sent_msgs[0];
    CHECK_EQ(note.targets, strings{"pm@team.example.net"});
    CHECK(contains(note.msg, "Error: no such object <mail/gone>"));
    CHECK(contains(note.msg, "Location: mail/gone"));
    CHECK(!contains(note.msg, "Original message:"));
  }

  // Garbage in the store: the original goes along with the report.
  {
    harness h;
    h.store.put("mail/junk", " no header here\r\n\r\nbody\r\n");
    auto const d = h.fwd.handle(h.env("junk", {"ok@example.com"}));
    CHECK(d == Disposition::stop_rule);
    CHECK(h.transport.sent_msgs.empty());
    CHECK_EQ(h.notices.sent_msgs.size(), 1u);
    auto const& note = h.notices.sent_msgs[0];
    CHECK_EQ(note.targets, strings{"pm@team.example.net"});
    CHECK(contains(note.msg, "Error: continuation line"));
    CHECK(contains(note.msg, "Original message:\r\n\r\n no header here"));
  }

  // A bare LF in From never reaches the outbound header block.
  {
    harness h;
    h.store.put("mail/inject", "From: evil\nBcc: victim@else.example\r\n"
                               "Subject: s\r\n\r\nbody\r\n");
    auto const d = h.fwd.handle(h.env("inject", {"ok@example.com"}));
    CHECK(d == Disposition::stop_rule);
    CHECK(h.transport.sent_msgs.empty());
    CHECK_EQ(h.notices.sent_msgs.size(), 1u);
    CHECK(contains(h.notices.sent_msgs[0].msg, "Error: bad header field"));
  }

  // Transport says no: still stop_rule, and the postmaster is told.
  {
    harness h;
    h.store.put("mail/m5", clean_msg);
    h.transport.refuse = true;
    auto const d = h.fwd.handle(h.env("m5", {"ok@example.com"}));
    CHECK(d == Disposition::stop_rule);
    CHECK(h.transport.sent_msgs.empty());

    CHECK_EQ(h.notices.sent_msgs.size(), 1u);
    auto const& note = h.notices.sent_msgs[0];
    CHECK_EQ(note.targets, strings{"pm@team.example.net"});
    CHECK(contains(note.msg, "Error: failed to forward email"));
    CHECK(contains(note.msg, "Location: mail/m5"));
    CHECK(contains(note.msg, "Original message:\r\n\r\n"
                             "Received: from mx by relay\r\n"));
  }

  // A notice that can't be sent doesn't change the answer.
  {
    harness h;
    h.store.put("mail/m7", clean_msg);
    h.transport.refuse = true;
    h.notices.refuse   = true;
    auto const d = h.fwd.handle(h.env("m7", {"ok@example.com"}));
    CHECK(d == Disposition::stop_rule);
    CHECK(h.transport.sent_msgs.empty());
    CHECK(h.notices.sent_msgs.empty());
  }

  // From JSON, bad events throw.
  {
    harness h;
    h.store.put("mail/m6", clean_msg);

    Json::Value event;
    std::string errs;
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> const reader(builder.newCharReader());
    auto constexpr text = R"({"Records":[{"eventSource":"aws:ses",
      "eventVersion":"1.0","ses":{"mail":{"messageId":"m6"},
      "receipt":{"recipients":["ok@example.com"]}}}]})";
    CHECK(reader->parse(text, text + std::strlen(text), &event, &errs)) << errs;

    CHECK(h.fwd.handle(event) == Disposition::stop_rule);
    CHECK_EQ(h.transport.sent_msgs.size(), 1u);

    try {
      h.fwd.handle(Json::Value(Json::objectValue));
      LOG(FATAL) << "empty event accepted";
    }
    catch (envelope_error const& e) {
      LOG(INFO) << "expected: " << e.what();
    }
    CHECK_EQ(h.transport.sent_msgs.size(), 1u);
  }

  {
    harness h;
    CHECK_EQ(h.fwd.location("abc"), "mail/abc");
  }
}
