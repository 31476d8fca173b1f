#include "Notifier.hpp"

#include "Now.hpp"
#include "Transport.hpp"
#include "message.hpp"

#include <iterator>

#include <fmt/format.h>

#include <glog/logging.h>

std::string Notifier::compose(std::string_view error,
                              std::string_view location,
                              std::string_view original) const
{
  Now const date;

  fmt::memory_buffer bfr;
  auto out = std::back_inserter(bfr);

  fmt::format_to(out, "{}: <{}>\r\n", message::From, postmaster_);
  fmt::format_to(out, "{}: <{}>\r\n", message::To, postmaster_);
  fmt::format_to(out, "{}: {}\r\n", message::Date, date.string());
  fmt::format_to(out, "{}: mailfwd: failed to process message\r\n",
                 message::Subject);
  fmt::format_to(out, "MIME-Version: 1.0\r\n");
  fmt::format_to(out, "Content-Type: text/plain; charset=utf-8\r\n");
  fmt::format_to(out, "\r\n");

  fmt::format_to(out, "Error: {}\r\n", error);
  if (!location.empty())
    fmt::format_to(out, "Location: {}\r\n", location);

  if (!original.empty()) {
    fmt::format_to(out, "\r\nOriginal message:\r\n\r\n");
    fmt::format_to(out, "{}", original);
  }

  return fmt::to_string(bfr);
}

void Notifier::notify(std::string_view error,
                      std::string_view location,
                      std::string_view original) noexcept
{
  if (postmaster_.empty()) {
    LOG(WARNING) << "no postmaster configured, not notifying about: " << error;
    return;
  }

  LOG(INFO) << "notifying postmaster <" << postmaster_ << ">";

  try {
    transport_.send({postmaster_}, postmaster_,
                    compose(error, location, original));
  }
  catch (std::exception const& e) {
    LOG(ERROR) << "failed to notify postmaster: " << e.what();
  }
}
