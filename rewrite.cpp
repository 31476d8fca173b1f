#include "rewrite.hpp"

#include "esc.hpp"

#include <algorithm>
#include <unordered_set>

#include <fmt/format.h>

#include <glog/logging.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace message {

std::string sanitize_display(std::string_view from)
{
  std::string name;
  name.reserve(from.size());
  for (auto const ch : from) {
    switch (ch) {
    case '"':
      break;
    case '<':
      name += '(';
      break;
    case '>':
      name += ')';
      break;
    default:
      name += ch;
    }
  }
  return name;
}

std::vector<std::string> rewrite_headers(parsed const&    msg,
                                         std::string_view primary)
{
  std::vector<std::string> lines;

  std::unordered_set<std::string> seen;

  std::string orig_from;
  bool        have_from     = false;
  bool        have_reply_to = false;

  auto emit = [&lines](header const& hdr) {
    lines.insert(end(lines), begin(hdr.raw_lines), end(hdr.raw_lines));
  };

  for (auto const& hdr : msg.headers) {
    // Stale once the message is rewritten, or refused by the transport.
    if (hdr == Return_Path || hdr == Sender || hdr == DKIM_Signature) {
      LOG(INFO) << "removing " << hdr.name;
      continue;
    }

    if (hdr == Reply_To &&
        boost::algorithm::all(hdr.value, boost::algorithm::is_space())) {
      LOG(INFO) << "removing empty " << Reply_To;
      continue;
    }

    auto const lc_name = boost::algorithm::to_lower_copy(hdr.name);

    if (seen.contains(lc_name) && !(hdr == Received)) {
      LOG(INFO) << "removing duplicate " << hdr.name;
      continue;
    }
    seen.insert(lc_name);

    if (hdr == From) {
      orig_from = hdr.value;
      have_from = true;

      auto const new_from = fmt::format("{}: \"{}\" <{}>", From,
                                        sanitize_display(orig_from), primary);
      LOG(INFO) << "replacing «" << esc(orig_from) << "» with «"
                << esc(new_from) << "»";
      lines.push_back(new_from);
      continue;
    }

    if (hdr == Reply_To) {
      LOG(INFO) << Reply_To << " already exists: " << esc(hdr.value);
      have_reply_to = true;
    }

    emit(hdr);
  }

  if (!have_reply_to) {
    if (have_from) {
      LOG(INFO) << "adding " << Reply_To << ": " << esc(orig_from);
      lines.push_back(fmt::format("{}: {}", Reply_To, orig_from));
    }
    else {
      LOG(WARNING) << Reply_To << " not added, message has no " << From;
    }
  }

  return lines;
}

} // namespace message
