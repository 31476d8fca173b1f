#include "Pattern.hpp"

#include "errors.hpp"

#include <fmt/format.h>

Pattern::Pattern(std::string_view literal)
  : pat_(std::string(literal))
{
}

Pattern::Pattern(std::string_view rx, bool icase)
{
  boost::regex::flag_type flags = boost::regex::perl;
  if (icase)
    flags |= boost::regex::icase;

  try {
    pat_ = regex{std::string(rx), icase,
                 boost::regex(rx.begin(), rx.end(), flags)};
  }
  catch (boost::regex_error const& e) {
    throw config_error(fmt::format("bad regex /{}/: {}", rx, e.what()));
  }
}

Pattern Pattern::from_string(std::string_view str)
{
  if (str.size() >= 2 && str.front() == '/') {
    auto const close = str.rfind('/');
    if (close != 0) {
      auto const flags = str.substr(close + 1);
      if (flags.find_first_not_of("i") == std::string_view::npos) {
        auto const icase = flags.find('i') != std::string_view::npos;
        return Pattern(str.substr(1, close - 1), icase);
      }
    }
  }
  return Pattern(str);
}

bool Pattern::matches(std::string_view text) const
{
  if (auto const lit = std::get_if<std::string>(&pat_))
    return text.find(*lit) != std::string_view::npos;

  auto const& rx = std::get<regex>(pat_);
  return boost::regex_search(text.begin(), text.end(), rx.compiled);
}

bool Pattern::matches_whole(std::string_view text) const
{
  if (auto const lit = std::get_if<std::string>(&pat_))
    return text == *lit;

  auto const& rx = std::get<regex>(pat_);
  return boost::regex_match(text.begin(), text.end(), rx.compiled);
}

std::string Pattern::as_string() const
{
  if (auto const lit = std::get_if<std::string>(&pat_))
    return fmt::format("\"{}\"", *lit);

  auto const& rx = std::get<regex>(pat_);
  return fmt::format("/{}/{}", rx.source, rx.icase ? "i" : "");
}
