#include "Rule.hpp"

#include <algorithm>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <fmt/format.h>

namespace address {

std::string_view local_part(std::string_view addr)
{
  auto const at = addr.rfind('@');
  if (at == std::string_view::npos)
    return addr;
  return addr.substr(0, at);
}

std::string_view domain(std::string_view addr)
{
  auto const at = addr.rfind('@');
  if (at == std::string_view::npos)
    return {};
  return addr.substr(at + 1);
}

} // namespace address

bool Rule::matches(std::string_view recipient) const
{
  if (auto const ex = std::get_if<exact>(&match))
    return recipient == ex->address;

  if (auto const hst = std::get_if<host>(&match))
    return boost::algorithm::iequals(address::domain(recipient),
                                     hst->domain);

  return std::get<Pattern>(match).matches_whole(recipient);
}

std::optional<std::string> Rule::rejects(std::string_view     recipient,
                                         std::string_view     subject,
                                         GlobalRejects const& globals) const
{
  if (allow_all)
    return {};

  auto const user =
      boost::algorithm::to_lower_copy(std::string(address::local_part(recipient)));
  if (std::find(begin(reject_users), end(reject_users), user) !=
      end(reject_users)) {
    return fmt::format("local-part \"{}\" is rejected", user);
  }

  if (reject_pattern && reject_pattern->matches(recipient))
    return fmt::format("address matches reject pattern {}",
                       reject_pattern->as_string());

  for (auto const& pat : reject_subject) {
    if (pat.matches(subject))
      return fmt::format("subject matches {}", pat.as_string());
  }

  for (auto const& pat : globals.subject) {
    if (pat.matches(subject))
      return fmt::format("subject matches global {}", pat.as_string());
  }

  return {};
}

std::string Rule::describe() const
{
  if (auto const ex = std::get_if<exact>(&match))
    return fmt::format("exact <{}>", ex->address);

  if (auto const hst = std::get_if<host>(&match))
    return fmt::format("host {}", hst->domain);

  return fmt::format("pattern {}", std::get<Pattern>(match).as_string());
}
