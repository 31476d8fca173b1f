#include "Transport.hpp"

#include "errors.hpp"

#include <fstream>
#include <iterator>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
std::string slurp(fs::path const& path)
{
  std::ifstream ifs(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(ifs),
                     std::istreambuf_iterator<char>());
}
} // namespace

int main(int argc, char* argv[])
{
  auto const spool
      = fs::temp_directory_path() / fmt::format("Transport-test-{}", getpid());

  auto constexpr msg = "From: \"a\" <ok@yourdomain.com>\r\n\r\nbody\r\n";

  {
    SpoolTransport transport(spool, "mx.example.com");
    transport.send({"user@example.net", "other@example.net"},
                   "ok@yourdomain.com", msg);

    auto const first = transport.last_delivered();
    CHECK(fs::exists(first));
    CHECK_EQ(first.parent_path(), spool / "new");
    CHECK(fs::is_empty(spool / "tmp"));

    auto const name = first.filename().string();
    CHECK_NE(name.find(".mx.example.com"), std::string::npos) << name;

    CHECK_EQ(slurp(first),
             fmt::format("X-Envelope-From: <ok@yourdomain.com>\r\n"
                         "X-Envelope-To: <user@example.net>\r\n"
                         "X-Envelope-To: <other@example.net>\r\n"
                         "{}",
                         msg));

    // A second delivery never reuses a name.
    transport.send({"user@example.net"}, "ok@yourdomain.com", msg);
    CHECK_NE(transport.last_delivered(), first);
    CHECK(fs::exists(first));
  }

  {
    auto const dry_spool = spool / "dry";
    SpoolTransport transport(dry_spool, "mx.example.com", true);
    transport.send({"user@example.net"}, "ok@yourdomain.com", msg);
    CHECK(transport.last_delivered().empty());
    CHECK(!fs::exists(dry_spool));
  }

  {
    // A regular file where the spool directory should be.
    auto const blocked = spool / "blocked";
    { std::ofstream ofs(blocked); }

    SpoolTransport transport(blocked, "mx.example.com");
    try {
      transport.send({"user@example.net"}, "ok@yourdomain.com", msg);
      LOG(FATAL) << "spooled into a plain file";
    }
    catch (forwarding_error const& e) {
      LOG(INFO) << "expected: " << e.what();
    }
  }

  {
    MemTransport transport;
    transport.send({"a@example.net", "b@example.net"}, "p@example.com", msg);
    CHECK_EQ(transport.sent_msgs.size(), 1u);
    CHECK_EQ(transport.sent_msgs[0].targets.size(), 2u);
    CHECK_EQ(transport.sent_msgs[0].source, "p@example.com");
    CHECK_EQ(transport.sent_msgs[0].msg, msg);

    transport.refuse = true;
    try {
      transport.send({"a@example.net"}, "p@example.com", msg);
      LOG(FATAL) << "refusing transport accepted a message";
    }
    catch (forwarding_error const& e) {
      LOG(INFO) << "expected: " << e.what();
    }
    CHECK_EQ(transport.sent_msgs.size(), 1u);
  }

  error_code ec;
  fs::remove_all(spool, ec);
}
