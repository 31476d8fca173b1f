#ifndef TRANSPORT_DOT_HPP
#define TRANSPORT_DOT_HPP

#include <string>
#include <string_view>
#include <vector>

#include "osutil.hpp"

// Outbound side: hands a finished message to whatever sends mail.

class Transport {
public:
  virtual ~Transport() = default;

  // Throws forwarding_error if the message isn't accepted.
  virtual void send(std::vector<std::string> const& targets,
                    std::string_view                source,
                    std::string_view                msg) = 0;
};

// Maildir style spool: write to tmp/, rename into new/ when complete.
// A relay picks entries up from new/ using the X-Envelope-* lines
// written ahead of the message.
class SpoolTransport : public Transport {
public:
  SpoolTransport(fs::path spool_dir, std::string fqdn, bool dry_run = false);

  void send(std::vector<std::string> const& targets,
            std::string_view                source,
            std::string_view                msg) override;

  fs::path const& last_delivered() const { return newfn_; }

private:
  fs::path    spool_dir_;
  std::string fqdn_;
  bool        dry_run_;

  unsigned deliveries_{0};

  fs::path newfn_;
};

// Keeps what it was given; can be told to refuse.
class MemTransport : public Transport {
public:
  struct sent {
    std::vector<std::string> targets;
    std::string              source;
    std::string              msg;
  };

  void send(std::vector<std::string> const& targets,
            std::string_view                source,
            std::string_view                msg) override;

  std::vector<sent> sent_msgs;

  bool refuse{false};
};

#endif // TRANSPORT_DOT_HPP
