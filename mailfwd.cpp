// Forward one inbound message according to the configured rules.
// Reads the receipt notification event, prints the disposition.

#include "Config.hpp"
#include "Envelope.hpp"
#include "Forwarder.hpp"
#include "Notifier.hpp"
#include "Store.hpp"
#include "Transport.hpp"
#include "errors.hpp"
#include "osutil.hpp"

#include <iostream>
#include <iterator>
#include <string>

#include <fmt/format.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_string(config, "", "rules file, default <config_dir>/mailfwd.json");
DEFINE_string(event, "-", "inbound event JSON file, - for stdin");
DEFINE_string(store_dir, "", "root directory of the message store");
DEFINE_string(spool_dir, "", "outbound spool directory");
DEFINE_bool(dry_run, false, "rewrite but don't spool anything");

namespace {
std::string read_event()
{
  if (FLAGS_event == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }

  try {
    return osutil::read_file(FLAGS_event);
  }
  catch (std::system_error const& e) {
    throw envelope_error(
        fmt::format("can't read event file {}: {}", FLAGS_event, e.what()));
  }
}
} // namespace

int main(int argc, char* argv[])
{
  std::ios::sync_with_stdio(false);

  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  auto const config_path =
      FLAGS_config.empty() ? osutil::get_config_dir() / "mailfwd.json"
                           : fs::path(FLAGS_config);

  auto const store_dir =
      FLAGS_store_dir.empty() ? fs::current_path() : fs::path(FLAGS_store_dir);
  auto const spool_dir = FLAGS_spool_dir.empty()
                             ? fs::current_path() / "spool"
                             : fs::path(FLAGS_spool_dir);

  try {
    auto const config = Config::load(config_path);

    DirStore       store(store_dir);
    SpoolTransport transport(spool_dir, osutil::get_server_id(), FLAGS_dry_run);
    Notifier       notifier(transport, config.postmaster);

    Forwarder forwarder(config, store, transport, notifier);

    auto const disposition = forwarder.handle(Envelope::parse(read_event()));

    std::cout << "{\"disposition\":\"" << disposition << "\"}\n";
  }
  catch (config_error const& e) {
    LOG(ERROR) << "bad config: " << e.what();
    return 2;
  }
  catch (envelope_error const& e) {
    LOG(ERROR) << "bad event: " << e.what();
    return 1;
  }
  catch (std::exception const& e) {
    LOG(ERROR) << e.what();
    return 3;
  }
}
