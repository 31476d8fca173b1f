#include "Config.hpp"

#include "errors.hpp"

#include <fstream>
#include <string>

#include <glog/logging.h>

namespace {
bool load_fails(std::string const& json, char const* why)
{
  try {
    Config::parse(json);
  }
  catch (config_error const& e) {
    LOG(INFO) << why << ": " << e.what();
    return true;
  }
  LOG(ERROR) << why << ": accepted";
  return false;
}
} // namespace

int main(int argc, char* argv[])
{
  auto constexpr good = R"({
    "postmaster": "ops@team.example.net",
    "storePrefix": "incoming/",
    "globalRules": {
      "rejectIfSubjectContains": ["MAKE.MONEY.FAST"],
      "rejectIfBodyContains": ["/click\\s+here/i", {"regex": "v[i1]agra", "icase": true}]
    },
    "rules": [
      { "matchHost": "example.com",
        "rejectUsers": ["Bad", "null"],
        "recipients": ["you@team.example.net"] },
      { "matchExact": "buddy@example.org",
        "recipients": ["buddy@team.example.net"] },
      { "matchPattern": "/^(biz|legal)@example\\.org$/i",
        "rejectPattern": "/^legal@/",
        "rejectIfSubjectContains": ["unsubscribe"],
        "recipients": ["you@team.example.net", "buddy@team.example.net"] },
      { "matchPattern": {"regex": "(abuse|admin|(web|post|host)master)@.*", "icase": true},
        "allowAll": true,
        "recipients": ["you@team.example.net"] }
    ]
  })";

  auto const cfg = Config::parse(good);

  CHECK_EQ(cfg.postmaster, "ops@team.example.net");
  CHECK_EQ(cfg.store_prefix, "incoming/");
  CHECK_EQ(cfg.globals.subject.size(), 1u);
  CHECK_EQ(cfg.globals.body.size(), 2u);
  CHECK(cfg.globals.body[0].is_regex());
  CHECK(cfg.globals.body[0].matches("please CLICK   here"));
  CHECK(cfg.globals.body[1].matches("V1AGRA"));

  CHECK_EQ(cfg.rules.size(), 4u);

  auto const& r0 = cfg.rules[0];
  CHECK(std::holds_alternative<Rule::host>(r0.match));
  CHECK_EQ(r0.reject_users.size(), 2u);
  CHECK_EQ(r0.reject_users[0], "bad"); // lowercased at load
  CHECK(!r0.allow_all);

  auto const& r1 = cfg.rules[1];
  CHECK(std::holds_alternative<Rule::exact>(r1.match));
  CHECK_EQ(std::get<Rule::exact>(r1.match).address, "buddy@example.org");

  auto const& r2 = cfg.rules[2];
  CHECK(std::holds_alternative<Pattern>(r2.match));
  CHECK(r2.reject_pattern);
  CHECK_EQ(r2.reject_subject.size(), 1u);
  CHECK_EQ(r2.recipients.size(), 2u);

  auto const& r3 = cfg.rules[3];
  CHECK(r3.allow_all);
  CHECK(r3.matches("WebMaster@anything.example"));

  // Minimal config: rules only.
  auto const bare = Config::parse(
      R"({"rules": [{"matchHost": "example.com", "recipients": ["a@b.c"]}]})");
  CHECK(bare.postmaster.empty());
  CHECK(bare.store_prefix.empty());
  CHECK(bare.globals.subject.empty());
  CHECK(bare.globals.body.empty());

  CHECK(load_fails("not json", "garbage"));
  CHECK(load_fails("[]", "array at top"));
  CHECK(load_fails("{}", "no rules"));
  CHECK(load_fails(R"({"rules": {}})", "rules not an array"));
  CHECK(load_fails(R"({"rules": [{"recipients": ["a@b.c"]}]})",
                   "no match criterion"));
  CHECK(load_fails(R"({"rules": [{"matchHost": "a.b", "matchExact": "x@a.b",
                                  "recipients": ["a@b.c"]}]})",
                   "two match criteria"));
  CHECK(load_fails(R"({"rules": [{"matchHost": "a.b"}]})", "no recipients"));
  CHECK(load_fails(R"({"rules": [{"matchHost": "a.b", "recipients": []}]})",
                   "empty recipients"));
  CHECK(load_fails(R"({"rules": [{"matchHost": 7, "recipients": ["a@b.c"]}]})",
                   "non-string host"));
  CHECK(load_fails(
      R"({"rules": [{"matchPattern": "/(/", "recipients": ["a@b.c"]}]})",
      "bad regex"));
  CHECK(load_fails(R"({"rules": [{"matchHost": "a.b", "allowAll": "yes",
                                  "recipients": ["a@b.c"]}]})",
                   "non-bool allowAll"));
  CHECK(load_fails(R"({"postmaster": 1, "rules": []})", "non-string postmaster"));
  CHECK(load_fails(R"({"globalRules": [], "rules": []})", "globalRules array"));

  // And from a file.
  auto const path = fs::temp_directory_path() / "mailfwd-Config-test.json";
  {
    std::ofstream ofs(path);
    ofs << good;
  }
  CHECK_EQ(Config::load(path).rules.size(), 4u);
  fs::remove(path);

  auto threw = false;
  try {
    Config::load(path);
  }
  catch (config_error const& e) {
    threw = true;
  }
  CHECK(threw);
}
