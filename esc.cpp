#include "esc.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include <fmt/format.h>

std::string esc(std::string_view str, size_t max_len)
{
  auto const dropped = str.size() > max_len ? str.size() - max_len : 0;
  str.remove_suffix(dropped);

  auto const nesc{std::count_if(begin(str), end(str), [](unsigned char c) {
    return (!std::isprint(c)) || (c == '\\');
  })};

  if (!nesc && !dropped)
    return std::string(str);

  fmt::memory_buffer bfr;
  auto out = std::back_inserter(bfr);

  for (auto c : str) {
    switch (c) {
    case '\a': fmt::format_to(out, "\\a"); break;
    case '\b': fmt::format_to(out, "\\b"); break;
    case '\f': fmt::format_to(out, "\\f"); break;
    case '\n': fmt::format_to(out, "\\n"); break;
    case '\r': fmt::format_to(out, "\\r"); break;
    case '\t': fmt::format_to(out, "\\t"); break;
    case '\v': fmt::format_to(out, "\\v"); break;
    case '\\': fmt::format_to(out, "\\\\"); break;
    default:
      if (std::isprint(static_cast<unsigned char>(c)))
        bfr.push_back(c);
      else
        fmt::format_to(out, "\\x{:02x}", static_cast<unsigned char>(c));
    }
  }

  if (dropped)
    fmt::format_to(out, "...({} more octets)", dropped);

  return fmt::to_string(bfr);
}
