#ifndef STORE_DOT_HPP
#define STORE_DOT_HPP

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>

#include "osutil.hpp"

// Where the raw inbound messages live.

class Store {
public:
  virtual ~Store() = default;

  // Raw message bytes at location, or throws retrieval_error.
  virtual std::string fetch(std::string_view location) = 0;

  // Human readable form of a location, for logs and operator mail.
  virtual std::string url(std::string_view location) const
  {
    return std::string(location);
  }
};

// One file per message under a root directory.
class DirStore : public Store {
public:
  explicit DirStore(fs::path root)
    : root_(std::move(root))
  {
  }

  std::string fetch(std::string_view location) override;
  std::string url(std::string_view location) const override;

private:
  fs::path root_;
};

// For tests, and for feeding a single message in by hand.
class MemStore : public Store {
public:
  void put(std::string location, std::string data)
  {
    objects_[std::move(location)] = std::move(data);
  }

  std::string fetch(std::string_view location) override;

  int fetches() const { return fetches_; }

private:
  std::map<std::string, std::string, std::less<>> objects_;

  int fetches_{0};
};

#endif // STORE_DOT_HPP
