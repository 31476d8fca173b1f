#ifndef RULE_DOT_HPP
#define RULE_DOT_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Pattern.hpp"

// Reject lists that apply to every rule that doesn't set allow_all.
struct GlobalRejects {
  std::vector<Pattern> subject;
  std::vector<Pattern> body;
};

struct Rule {
  struct exact {
    std::string address;
  };
  struct host {
    std::string domain;
  };

  // Exactly one match criterion; the loader refuses anything else.
  std::variant<exact, host, Pattern> match;

  // Lowercased local-parts.
  std::vector<std::string> reject_users;

  // Tested against the whole recipient address.
  std::optional<Pattern> reject_pattern;

  std::vector<Pattern> reject_subject;

  // Bypass every reject check, the global ones included.
  bool allow_all{false};

  std::vector<std::string> recipients;

  bool matches(std::string_view recipient) const;

  // If the recipient must be rejected, a short reason; else nothing.
  std::optional<std::string> rejects(std::string_view     recipient,
                                     std::string_view     subject,
                                     GlobalRejects const& globals) const;

  std::string describe() const;
};

namespace address {
// Text before the last '@', or all of it when there's no '@'.
std::string_view local_part(std::string_view addr);

// Text after the last '@', or empty.
std::string_view domain(std::string_view addr);
} // namespace address

#endif // RULE_DOT_HPP
