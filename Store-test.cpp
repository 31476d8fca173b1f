#include "Store.hpp"

#include "errors.hpp"

#include <fstream>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
template <typename S>
void fetch_fails(S& store, std::string_view location)
{
  try {
    store.fetch(location);
  }
  catch (retrieval_error const& e) {
    LOG(INFO) << "expected: " << e.what();
    return;
  }
  LOG(FATAL) << "fetch of " << location << " should have failed";
}
} // namespace

int main(int argc, char* argv[])
{
  {
    auto const root = fs::temp_directory_path()
                      / fmt::format("Store-test-{}", getpid());
    fs::create_directories(root / "inbound");

    auto constexpr mail = "Subject: stored\r\n\r\nbody\r\n";
    {
      std::ofstream ofs(root / "inbound" / "abc123", std::ios::binary);
      ofs << mail;
    }
    {
      std::ofstream ofs(root / "inbound" / "empty", std::ios::binary);
    }

    DirStore store(root);
    CHECK_EQ(store.fetch("inbound/abc123"), mail);
    CHECK_EQ(store.url("inbound/abc123"), (root / "inbound/abc123").string());

    fetch_fails(store, "inbound/missing");
    fetch_fails(store, "inbound/empty");

    // A directory isn't a message.
    fetch_fails(store, "inbound");

    error_code ec;
    fs::remove_all(root, ec);
  }

  {
    MemStore store;
    store.put("inbound/m1", "Subject: x\r\n\r\n");
    store.put("inbound/empty", "");

    CHECK_EQ(store.fetch("inbound/m1"), "Subject: x\r\n\r\n");
    CHECK_EQ(store.url("inbound/m1"), "inbound/m1");

    fetch_fails(store, "inbound/m2");
    fetch_fails(store, "inbound/empty");

    CHECK_EQ(store.fetches(), 3);
  }
}
