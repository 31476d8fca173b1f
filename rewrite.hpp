#ifndef REWRITE_DOT_HPP
#define REWRITE_DOT_HPP

#include <string>
#include <string_view>
#include <vector>

#include "message.hpp"

namespace message {

// Strip the quotes and turn <> into () so the old From can sit inside
// a quoted display-name.
std::string sanitize_display(std::string_view from);

// Drop Return-Path, Sender and DKIM-Signature, drop empty Reply-To and
// repeated fields (Received excepted), replace From with one naming
// the primary recipient, and add a Reply-To pointing at the original
// From when the message has none.
std::vector<std::string> rewrite_headers(parsed const&    msg,
                                         std::string_view primary);

} // namespace message

#endif // REWRITE_DOT_HPP
