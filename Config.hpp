#ifndef CONFIG_DOT_HPP
#define CONFIG_DOT_HPP

#include <string>
#include <string_view>
#include <vector>

#include "Rule.hpp"
#include "osutil.hpp"

namespace Json {
class Value;
}

// Everything read from the JSON config file; read-only once loaded.

struct Config {
  std::string postmaster;

  // Prepended to the message id to form the storage location.
  std::string store_prefix;

  std::vector<Rule> rules;
  GlobalRejects     globals;

  static Config load(fs::path const& path);
  static Config parse(std::string_view json_text);
  static Config from_json(Json::Value const& root);
};

#endif // CONFIG_DOT_HPP
