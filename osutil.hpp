#ifndef OSUTIL_DOT_HPP_INCLUDED
#define OSUTIL_DOT_HPP_INCLUDED

#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using std::error_code;

namespace osutil {

// --config_dir, else $MAILFWD_CONFIG_DIR, else where the binary lives.
fs::path get_config_dir();

fs::path get_exe_path();

// Names this host in spool file names: $MAILFWD_SERVER_ID or the
// node name.
std::string get_server_id();

// Whole file, memory mapped; empty string for an empty file.  Throws
// std::system_error if it can't be read.
std::string read_file(fs::path const& path);

} // namespace osutil

#endif // OSUTIL_DOT_HPP_INCLUDED
