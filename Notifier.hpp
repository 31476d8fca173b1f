#ifndef NOTIFIER_DOT_HPP
#define NOTIFIER_DOT_HPP

#include <string>
#include <string_view>
#include <utility>

class Transport;

// Tells a human when a message couldn't be forwarded.

class Notifier {
public:
  Notifier(Transport& transport, std::string postmaster)
    : transport_(transport)
    , postmaster_(std::move(postmaster))
  {
  }

  // Build the diagnostic message; location and original may be empty.
  std::string compose(std::string_view error,
                      std::string_view location,
                      std::string_view original) const;

  // Never throws, a failure here must not hide the original one.
  void notify(std::string_view error,
              std::string_view location,
              std::string_view original) noexcept;

private:
  Transport&  transport_;
  std::string postmaster_;
};

#endif // NOTIFIER_DOT_HPP
