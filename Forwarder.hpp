#ifndef FORWARDER_DOT_HPP
#define FORWARDER_DOT_HPP

#include <ostream>
#include <string_view>

#include "Config.hpp"
#include "Envelope.hpp"
#include "Resolver.hpp"
#include "message.hpp"

class Notifier;
class Store;
class Transport;

// What the surrounding mail system should do with the message next.
enum class Disposition : bool {
  continue_, // not ours, let it bounce
  stop_rule, // we've taken care of it
};

char const* as_string(Disposition d);

inline std::ostream& operator<<(std::ostream& s, Disposition d)
{
  return s << as_string(d);
}

class Forwarder {
public:
  Forwarder(Forwarder const&) = delete;
  Forwarder& operator=(Forwarder const&) = delete;

  Forwarder(Config const& config,
            Store&        store,
            Transport&    transport,
            Notifier&     notifier)
    : config_(config)
    , resolver_(config.rules, config.globals)
    , store_(store)
    , transport_(transport)
    , notifier_(notifier)
  {
  }

  // Throws envelope_error for a malformed event; every later failure,
  // rule matching included, is reported to the postmaster and answered
  // with stop_rule.
  Disposition handle(Json::Value const& event);
  Disposition handle(Envelope const& env);

  // Parse, rewrite and filter one raw message.  Throws malformed_message.
  message::rewritten process(std::string_view  raw,
                             Resolution const& res) const;

  std::string location(std::string_view message_id) const;

private:
  Config const& config_;
  Resolver      resolver_;
  Store&        store_;
  Transport&    transport_;
  Notifier&     notifier_;
};

#endif // FORWARDER_DOT_HPP
