#ifndef ENVELOPE_DOT_HPP
#define ENVELOPE_DOT_HPP

#include <string>
#include <string_view>
#include <vector>

namespace Json {
class Value;
}

// What we need out of the inbound receipt notification.

struct Envelope {
  std::string              message_id;
  std::vector<std::string> recipients;
  std::string              subject;

  // Throws envelope_error unless the event has exactly one record of
  // the expected source and version, with object-shaped ses, mail and
  // receipt members.
  static Envelope from_event(Json::Value const& event);

  static Envelope parse(std::string_view json_text);
};

namespace Event {
auto constexpr source  = "aws:ses";
auto constexpr version = "1.0";
} // namespace Event

#endif // ENVELOPE_DOT_HPP
