#include "Envelope.hpp"

#include "errors.hpp"

#include <glog/logging.h>
#include <glog/stl_logging.h>

#include <json/value.h>

namespace {
auto constexpr good_event = R"({
  "Records": [{
    "eventSource": "aws:ses",
    "eventVersion": "1.0",
    "ses": {
      "mail": {
        "messageId": "o3vrnil0e2ic28trm7dfhrc2v0clambda4nbp0g1",
        "source": "sender@example.com",
        "commonHeaders": {
          "from": ["Sender <sender@example.com>"],
          "subject": "Hello there"
        }
      },
      "receipt": {
        "recipients": ["info@example.com", "sales@example.com"]
      }
    }
  }]
})";

void parse_fails(char const* json, char const* why)
{
  try {
    Envelope::parse(json);
  }
  catch (envelope_error const& e) {
    LOG(INFO) << "expected: " << e.what();
    std::string_view const msg{e.what()};
    CHECK_NE(msg.find(why), std::string_view::npos)
        << "«" << msg << "» doesn't mention «" << why << "»";
    return;
  }
  LOG(FATAL) << "should have failed: " << json;
}

std::string record(char const* ses)
{
  return std::string(R"({"Records":[{"eventSource":"aws:ses",)"
                     R"("eventVersion":"1.0","ses":)")
         + ses + "}]}";
}
} // namespace

int main(int argc, char* argv[])
{
  {
    auto const env = Envelope::parse(good_event);
    CHECK_EQ(env.message_id, "o3vrnil0e2ic28trm7dfhrc2v0clambda4nbp0g1");
    CHECK_EQ(env.recipients, (std::vector<std::string>{"info@example.com",
                                                       "sales@example.com"}));
    CHECK_EQ(env.subject, "Hello there");
  }

  // No commonHeaders, no subject.
  {
    auto const env = Envelope::parse(
        record(R"({"mail":{"messageId":"m1"},"receipt":{"recipients":["a@b"]}})")
            .c_str());
    CHECK_EQ(env.message_id, "m1");
    CHECK_EQ(env.recipients.size(), 1u);
    CHECK(env.subject.empty());
  }

  // Built directly, no JSON text involved.
  {
    Json::Value event;
    try {
      Envelope::from_event(event);
      LOG(FATAL) << "null event accepted";
    }
    catch (envelope_error const& e) {
      CHECK_EQ(std::string_view(e.what()), "missing event");
    }
  }

  parse_fails("not json", "not valid JSON");
  parse_fails("[]", "non-object event");
  parse_fails("{}", "missing Records");
  parse_fails(R"({"Records":{}})", "non-array Records");
  parse_fails(R"({"Records":[]})", "length 0");
  parse_fails(R"({"Records":[{},{}]})", "length 2");
  parse_fails(R"({"Records":[42]})", "non-object record");
  parse_fails(R"({"Records":[{"eventSource":"aws:s3","eventVersion":"1.0"}]})",
              "eventSource 'aws:s3'");
  parse_fails(R"({"Records":[{"eventSource":"aws:ses","eventVersion":"2.0"}]})",
              "eventVersion '2.0'");
  parse_fails(R"({"Records":[{"eventSource":"aws:ses","eventVersion":1}]})",
              "eventVersion ''");
  parse_fails(R"({"Records":[{"eventSource":"aws:ses","eventVersion":"1.0"}]})",
              "missing ses");
  parse_fails(record("[]").c_str(), "non-object ses");
  parse_fails(record(R"({"receipt":{}})").c_str(), "missing mail");
  parse_fails(record(R"({"mail":{}})").c_str(), "missing receipt");
  parse_fails(record(R"({"mail":{},"receipt":{"recipients":["a@b"]}})").c_str(),
              "no messageId");
  parse_fails(record(R"({"mail":{"messageId":""},"receipt":{"recipients":["a@b"]}})")
                  .c_str(),
              "no messageId");
  parse_fails(record(R"({"mail":{"messageId":"m"},"receipt":{}})").c_str(),
              "did not contain recipients");
  parse_fails(
      record(R"({"mail":{"messageId":"m"},"receipt":{"recipients":[]}})").c_str(),
      "did not contain recipients");
  parse_fails(
      record(R"({"mail":{"messageId":"m"},"receipt":{"recipients":[7]}})").c_str(),
      "non-string recipient");
}
