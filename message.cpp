// What you get where:

// RFC5322 header fields, one per logical line; a line starting with
// WSP continues the field before it.  The first empty line ends the
// header section, the rest is body and is left alone.

#include "message.hpp"

#include "errors.hpp"
#include "esc.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <glog/logging.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

static std::string_view trim_left(std::string_view v)
{
  auto constexpr WS = " \t";
  v.remove_prefix(std::min(v.find_first_not_of(WS), v.size()));
  return v;
}

static std::vector<std::string> split_lines(std::string_view input,
                                            std::string_view eol)
{
  std::vector<std::string> lines;
  for (;;) {
    auto const pos = input.find(eol);
    if (pos == std::string_view::npos) {
      lines.emplace_back(input);
      return lines;
    }
    lines.emplace_back(input.substr(0, pos));
    input.remove_prefix(pos + eol.size());
  }
}

namespace RFC5322 {

// clang-format off

struct ftext            : ranges<33, 57, 59, 126> {};

struct field_name       : plus<ftext> {};

// no bare CR or LF left over from a mixed line ending
struct field_value      : star<not_one<'\r', '\n'>> {};

// token ":" *SP value, on an already unfolded line
struct field            : seq<field_name, one<':'>, star<SP>, field_value, eof> {};

// clang-format on

struct field_parts {
  std::string name;
  std::string value;
};

template <typename Rule>
struct field_action : nothing<Rule> {
};

template <>
struct field_action<field_name> {
  template <typename Input>
  static void apply(Input const& in, field_parts& parts)
  {
    parts.name = in.string();
  }
};

template <>
struct field_action<field_value> {
  template <typename Input>
  static void apply(Input const& in, field_parts& parts)
  {
    parts.value = in.string();
  }
};

} // namespace RFC5322

namespace message {

namespace {
// Accumulates the physical lines of one header field.
struct pending_field {
  std::string              text;
  std::vector<std::string> raw;

  bool empty() const { return raw.empty(); }

  void start(std::string const& line)
  {
    text = line;
    raw.assign(1, line);
  }

  void add_continuation(std::string const& line)
  {
    text += ' ';
    text += trim_left(line);
    raw.push_back(line);
  }

  void flush(std::vector<header>& headers)
  {
    if (empty())
      return;

    RFC5322::field_parts parts;
    auto in{memory_input<>(text.data(), text.size(), "header")};
    if (!tao::pegtl::parse<RFC5322::field, RFC5322::field_action>(in, parts)) {
      throw malformed_message(
          fmt::format("bad header field «{}»", esc(text)));
    }
    headers.emplace_back(std::move(parts.name), std::move(parts.value),
                         std::move(raw));
    text.clear();
    raw.clear();
  }
};
} // namespace

void parsed::parse(std::string_view input)
{
  headers.clear();
  body.clear();
  separator_found = false;

  eol = (input.find(CRLF) != std::string_view::npos) ? CRLF : "\n";

  auto const lines = split_lines(input, eol);

  pending_field pending;

  auto line = begin(lines);
  for (; line != end(lines); ++line) {
    if (line->empty()) {
      pending.flush(headers);
      separator_found = true;
      ++line;
      break;
    }

    if (line->front() == ' ' || line->front() == '\t') {
      if (pending.empty()) {
        throw malformed_message(fmt::format(
            "continuation line «{}» before any header", esc(*line)));
      }
      pending.add_continuation(*line);
      continue;
    }

    pending.flush(headers);
    pending.start(*line);
  }
  pending.flush(headers);

  body.assign(line, end(lines));

  if (headers.empty()) {
    throw malformed_message(separator_found
                                ? "no header fields before the separator"
                                : "no header fields and no separator");
  }

  LOG(INFO) << "parsed " << headers.size() << " header fields, "
            << body.size() << " body lines"
            << (separator_found ? "" : ", no separator line");
}

std::string_view parsed::get_header(std::string_view name) const
{
  if (auto hdr = std::find(begin(headers), end(headers), name);
      hdr != end(headers)) {
    return hdr->value;
  }
  return "";
}

std::string reassemble(std::vector<std::string> const& header_lines,
                       std::vector<std::string> const& body,
                       std::string_view                eol)
{
  fmt::memory_buffer bfr;

  for (auto const& h : header_lines)
    fmt::format_to(std::back_inserter(bfr), "{}{}", h, eol);

  fmt::format_to(std::back_inserter(bfr), "{}", eol);

  fmt::format_to(std::back_inserter(bfr), "{}", fmt::join(body, eol));

  return fmt::to_string(bfr);
}

std::string rewritten::as_string() const
{
  CHECK(!vetoed) << "vetoed message has no wire form";
  return reassemble(header_lines, body, eol);
}

} // namespace message
