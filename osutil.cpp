#include "osutil.hpp"

#include <climits>
#include <cstdlib>

#include <sys/utsname.h>
#include <unistd.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <boost/iostreams/device/mapped_file.hpp>

DEFINE_string(config_dir, "", "directory holding mailfwd.json");

namespace osutil {

fs::path get_config_dir()
{
  if (!FLAGS_config_dir.empty())
    return FLAGS_config_dir;

  if (auto const ev = getenv("MAILFWD_CONFIG_DIR"); ev)
    return ev;

  return get_exe_path().parent_path();
}

fs::path get_exe_path()
{
  // Not fs::read_symlink(), /proc/self/exe reports st_size of zero.
  auto constexpr exe = "/proc/self/exe";

  char buf[PATH_MAX];

  auto const len{::readlink(exe, buf, sizeof(buf) - 1)};
  PCHECK(len != -1) << "readlink " << exe;
  buf[len] = '\0';

  return fs::path(buf);
}

std::string get_server_id()
{
  if (auto const id = getenv("MAILFWD_SERVER_ID"); id)
    return id;

  utsname un;
  PCHECK(uname(&un) == 0);

  return un.nodename;
}

std::string read_file(fs::path const& path)
{
  error_code ec;
  auto const size = fs::file_size(path, ec);
  if (ec)
    throw std::system_error(ec, path.string());

  if (size == 0)
    return {};

  boost::iostreams::mapped_file_source file;
  file.open(path.string());

  return std::string(file.data(), file.size());
}

} // namespace osutil
