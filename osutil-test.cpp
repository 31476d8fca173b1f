#include "osutil.hpp"

#include <cstdlib>
#include <fstream>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  unsetenv("MAILFWD_CONFIG_DIR");
  unsetenv("MAILFWD_SERVER_ID");

  auto const config_path = osutil::get_config_dir();
  auto const exe_path    = osutil::get_exe_path();

  fs::path argv0 = argv[0];
  CHECK_EQ(argv0.filename(), exe_path.filename());
  CHECK_EQ(config_path, exe_path.parent_path());
  CHECK(!osutil::get_server_id().empty());

  setenv("MAILFWD_CONFIG_DIR", "/etc/mailfwd", 1);
  CHECK_EQ(osutil::get_config_dir(), fs::path("/etc/mailfwd"));

  setenv("MAILFWD_SERVER_ID", "mx.example.net", 1);
  CHECK_EQ(osutil::get_server_id(), "mx.example.net");

  auto const dir
      = fs::temp_directory_path() / fmt::format("osutil-test-{}", getpid());
  fs::create_directories(dir);

  {
    std::ofstream some(dir / "some", std::ios::binary);
    some << "To: x\r\n\r\n";
    std::ofstream none(dir / "none", std::ios::binary);
  }
  CHECK_EQ(osutil::read_file(dir / "some"), "To: x\r\n\r\n");
  CHECK_EQ(osutil::read_file(dir / "none"), "");

  try {
    osutil::read_file(dir / "missing");
    LOG(FATAL) << "read a file that isn't there";
  }
  catch (std::system_error const& e) {
    LOG(INFO) << "expected: " << e.what();
  }

  error_code ec;
  fs::remove_all(dir, ec);
}
