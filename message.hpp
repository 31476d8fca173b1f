#ifndef MESSAGE_DOT_HPP_INCLUDED
#define MESSAGE_DOT_HPP_INCLUDED

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>


namespace message {

// RFC-5322 header names
auto constexpr DKIM_Signature = "DKIM-Signature";
auto constexpr Date           = "Date";
auto constexpr From           = "From";
auto constexpr Received       = "Received";
auto constexpr Reply_To       = "Reply-To";
auto constexpr Return_Path    = "Return-Path";
auto constexpr Sender         = "Sender";
auto constexpr Subject        = "Subject";
auto constexpr To             = "To";

auto constexpr CRLF = "\r\n";

struct header {
  header(std::string n, std::string v, std::vector<std::string> raw)
    : name(std::move(n))
    , value(std::move(v))
    , raw_lines(std::move(raw))
  {
  }

  // Field names compare without regard to case.
  bool operator==(std::string_view n) const
  {
    return boost::algorithm::iequals(n, name);
  }

  std::string name;

  // Unfolded: continuation lines joined with a single space.
  std::string value;

  // The physical lines as they came in, folding intact.
  std::vector<std::string> raw_lines;
};

struct parsed {
  // Throws malformed_message.
  void parse(std::string_view input);

  std::string_view get_header(std::string_view name) const;

  std::vector<header> headers;

  // Everything after the blank separator line, verbatim.
  std::vector<std::string> body;

  bool separator_found{false};

  // Line terminator used by the input, CRLF unless it has only bare LFs.
  std::string eol{CRLF};
};

struct rewritten {
  std::vector<std::string> header_lines;
  std::vector<std::string> body;
  std::string              eol{CRLF};

  // Body filter said no; nothing gets sent.
  bool vetoed{false};

  std::string as_string() const;
};

// Header lines, one blank line, then the body, all with eol.
std::string reassemble(std::vector<std::string> const& header_lines,
                       std::vector<std::string> const& body,
                       std::string_view                eol);

} // namespace message

#endif // MESSAGE_DOT_HPP_INCLUDED
