#include "Forwarder.hpp"

#include "Notifier.hpp"
#include "Store.hpp"
#include "Transport.hpp"
#include "esc.hpp"
#include "filter.hpp"
#include "rewrite.hpp"

#include <utility>

#include <fmt/format.h>

#include <glog/logging.h>

#include <json/value.h>
#include <json/writer.h>

char const* as_string(Disposition d)
{
  switch (d) {
  case Disposition::continue_: return "CONTINUE";
  case Disposition::stop_rule: return "STOP_RULE";
  }
  return "(unknown)";
}

std::string Forwarder::location(std::string_view message_id) const
{
  return fmt::format("{}{}", config_.store_prefix, message_id);
}

message::rewritten Forwarder::process(std::string_view  raw,
                                      Resolution const& res) const
{
  LOG(INFO) << "original message: " << esc(raw, 64 * 1024);

  message::parsed msg;
  msg.parse(raw);

  LOG(INFO) << message::From << ": " << esc(msg.get_header(message::From))
            << ", " << message::Subject << ": "
            << esc(msg.get_header(message::Subject));

  message::rewritten out;
  out.eol          = msg.eol;
  out.header_lines = message::rewrite_headers(msg, res.primary);

  if (res.allow_all) {
    LOG(INFO) << "allow_all rule, skipping body filter";
  }
  else if (message::body_vetoed(msg.body, config_.globals.body)) {
    out.vetoed = true;
    return out;
  }

  out.body = std::move(msg.body);
  return out;
}

Disposition Forwarder::handle(Json::Value const& event)
{
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  LOG(INFO) << "event: " << esc(Json::writeString(builder, event));

  return handle(Envelope::from_event(event));
}

Disposition Forwarder::handle(Envelope const& env)
{
  // Whatever we got before something failed goes to the postmaster.
  std::string url;
  std::string original;

  try {
    // A subject pattern can throw if matching gets out of hand.
    auto const res = resolver_.resolve(env.recipients, env.subject);
    if (res.empty()) {
      LOG(INFO) << "no recipients after rule processing, let it bounce";
      return Disposition::continue_;
    }

    auto const loc = location(env.message_id);
    url            = store_.url(loc);
    original       = store_.fetch(loc);

    auto const msg = process(original, res);
    if (msg.vetoed) {
      LOG(INFO) << "message body rejected, let it bounce";
      return Disposition::continue_;
    }

    transport_.send(res.targets, res.primary, msg.as_string());
    LOG(INFO) << "forwarded " << env.message_id;
  }
  catch (std::exception const& e) {
    LOG(ERROR) << e.what();
    LOG(ERROR) << "failed to process message, notifying postmaster";
    notifier_.notify(e.what(), url, original);
  }

  return Disposition::stop_rule;
}
