#ifndef ESC_DOT_HPP
#define ESC_DOT_HPP

#include <cstddef>
#include <string>
#include <string_view>

// C style escapes for anything unprintable, so raw message text can go
// into a single log line.  Input beyond max_len octets is dropped and
// the cut is noted at the end.
std::string esc(std::string_view str, size_t max_len = std::string::npos);

#endif // ESC_DOT_HPP
