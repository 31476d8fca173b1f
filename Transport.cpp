#include "Transport.hpp"

#include "Now.hpp"
#include "errors.hpp"

#include <fstream>
#include <iterator>

#include <unistd.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <glog/logging.h>

SpoolTransport::SpoolTransport(fs::path spool_dir, std::string fqdn, bool dry_run)
  : spool_dir_(std::move(spool_dir))
  , fqdn_(std::move(fqdn))
  , dry_run_(dry_run)
{
}

void SpoolTransport::send(std::vector<std::string> const& targets,
                          std::string_view                source,
                          std::string_view                msg)
{
  CHECK(!targets.empty());

  LOG(INFO) << "sending " << source << " -> ["
            << fmt::format("{}", fmt::join(targets, ", ")) << "], "
            << msg.size() << " octets";

  if (dry_run_) {
    LOG(INFO) << "dry run, not spooling";
    return;
  }

  auto newfn = spool_dir_ / "new";
  auto tmpfn = spool_dir_ / "tmp";

  error_code ec;
  fs::create_directories(newfn, ec);
  fs::create_directories(tmpfn, ec);

  // Unique name, see: <https://cr.yp.to/proto/maildir.html>
  Now const  then;
  auto const uniq{fmt::format("{}.M{}P{}Q{}.{}", then.sec(), then.usec(),
                              getpid(), ++deliveries_, fqdn_)};
  newfn /= uniq;
  tmpfn /= uniq;

  fmt::memory_buffer bfr;
  fmt::format_to(std::back_inserter(bfr), "X-Envelope-From: <{}>\r\n", source);
  for (auto const& target : targets)
    fmt::format_to(std::back_inserter(bfr), "X-Envelope-To: <{}>\r\n", target);

  try {
    std::ofstream ofs;
    ofs.exceptions(std::ofstream::failbit | std::ofstream::badbit);
    ofs.open(tmpfn, std::ios::binary);
    ofs.write(bfr.data(), bfr.size());
    ofs.write(msg.data(), msg.size());
    ofs.close();
  }
  catch (std::exception const& e) {
    fs::remove(tmpfn, ec);
    throw forwarding_error(
        fmt::format("failed to forward email: can't write {}: {}",
                    tmpfn.string(), e.what()));
  }

  fs::rename(tmpfn, newfn, ec);
  if (ec) {
    auto const why = ec.message();
    fs::remove(tmpfn, ec);
    throw forwarding_error(
        fmt::format("failed to forward email: can't rename {} to {}: {}",
                    tmpfn.string(), newfn.string(), why));
  }

  newfn_ = newfn;
  LOG(INFO) << "successfully spooled " << newfn_;
}

void MemTransport::send(std::vector<std::string> const& targets,
                        std::string_view                source,
                        std::string_view                msg)
{
  if (refuse)
    throw forwarding_error(
        fmt::format("failed to forward email from {}: refused", source));

  sent_msgs.push_back(sent{targets, std::string(source), std::string(msg)});
}
