#include "Envelope.hpp"

#include "errors.hpp"
#include "esc.hpp"

#include <memory>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <glog/logging.h>

#include <json/reader.h>
#include <json/value.h>

namespace {

Json::Value const& member_object(Json::Value const& obj,
                                 char const*        key,
                                 char const*        what)
{
  if (!obj.isMember(key))
    throw envelope_error(fmt::format("{} is missing {} field", what, key));

  auto const& v = obj[key];
  if (!v.isObject())
    throw envelope_error(fmt::format("{} has non-object {} field", what, key));

  return v;
}

std::string string_member(Json::Value const& obj, char const* key)
{
  auto const& v = obj[key];
  return v.isString() ? v.asString() : std::string{};
}

} // namespace

Envelope Envelope::from_event(Json::Value const& event)
{
  if (event.isNull())
    throw envelope_error("missing event");

  if (!event.isObject())
    throw envelope_error("non-object event");

  if (!event.isMember("Records"))
    throw envelope_error("event is missing Records array");

  auto const& records = event["Records"];
  if (!records.isArray())
    throw envelope_error("event has non-array Records field");

  if (records.size() != 1)
    throw envelope_error(fmt::format(
        "event Records array has length {}; expected 1", records.size()));

  auto const& record = records[Json::ArrayIndex{0}];
  if (!record.isObject())
    throw envelope_error("non-object record");

  auto const source = string_member(record, "eventSource");
  if (source != Event::source)
    throw envelope_error(fmt::format(
        "record has eventSource '{}'; expected '{}'", source, Event::source));

  auto const version = string_member(record, "eventVersion");
  if (version != Event::version)
    throw envelope_error(
        fmt::format("record has eventVersion '{}'; expected '{}'", version,
                    Event::version));

  auto const& ses     = member_object(record, "ses", "record");
  auto const& mail    = member_object(ses, "mail", "record ses data");
  auto const& receipt = member_object(ses, "receipt", "record ses data");

  Envelope env;

  auto const& id = mail["messageId"];
  if (!id.isString() || id.asString().empty())
    throw envelope_error("record mail has no messageId");
  env.message_id = id.asString();

  auto const& rcpts = receipt["recipients"];
  if (!rcpts.isArray() || rcpts.empty())
    throw envelope_error("record did not contain recipients");
  for (auto const& rcpt : rcpts) {
    if (!rcpt.isString())
      throw envelope_error("record has a non-string recipient");
    env.recipients.push_back(rcpt.asString());
  }

  if (mail.isMember("commonHeaders") && mail["commonHeaders"].isObject()) {
    auto const& subject = mail["commonHeaders"]["subject"];
    if (subject.isString())
      env.subject = subject.asString();
  }

  LOG(INFO) << "message " << env.message_id << " for "
            << fmt::format("{}", fmt::join(env.recipients, ", "));

  return env;
}

Envelope Envelope::parse(std::string_view json_text)
{
  LOG(INFO) << "event: " << esc(json_text);

  Json::CharReaderBuilder builder;

  std::unique_ptr<Json::CharReader> const reader(builder.newCharReader());

  Json::Value event;
  std::string errs;
  if (!reader->parse(json_text.data(), json_text.data() + json_text.size(),
                     &event, &errs)) {
    throw envelope_error(fmt::format("event is not valid JSON: {}", errs));
  }

  return from_event(event);
}
