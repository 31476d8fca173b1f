#ifndef ERRORS_DOT_HPP
#define ERRORS_DOT_HPP

#include <stdexcept>

// Bad rule configuration, detected at load time.
struct config_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The inbound event isn't the shape we expect, fatal for the invocation.
struct envelope_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct retrieval_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Header block can't be parsed.
struct malformed_message : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The transport refused the rewritten message.
struct forwarding_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

#endif // ERRORS_DOT_HPP
