#include "Config.hpp"

#include "errors.hpp"

#include <fmt/format.h>

#include <glog/logging.h>

#include <boost/algorithm/string/case_conv.hpp>

#include <json/reader.h>
#include <json/value.h>

#include <memory>

namespace {

// Config keys, camelCase as in the original rule files.
auto constexpr Postmaster               = "postmaster";
auto constexpr Store_prefix             = "storePrefix";
auto constexpr Global_rules             = "globalRules";
auto constexpr Rules                    = "rules";
auto constexpr Match_exact              = "matchExact";
auto constexpr Match_host               = "matchHost";
auto constexpr Match_pattern            = "matchPattern";
auto constexpr Reject_users             = "rejectUsers";
auto constexpr Reject_pattern           = "rejectPattern";
auto constexpr Reject_if_subject        = "rejectIfSubjectContains";
auto constexpr Reject_if_body           = "rejectIfBodyContains";
auto constexpr Allow_all                = "allowAll";
auto constexpr Recipients               = "recipients";

std::string get_string(Json::Value const& v, std::string_view where)
{
  if (!v.isString())
    throw config_error(fmt::format("{} must be a string", where));
  return v.asString();
}

// A pattern is "literal", "/regex/flags", or {"regex": "...", "icase": bool}.
Pattern get_pattern(Json::Value const& v, std::string_view where)
{
  if (v.isString())
    return Pattern::from_string(v.asString());

  if (v.isObject() && v.isMember("regex")) {
    auto const rx    = get_string(v["regex"], fmt::format("{}.regex", where));
    auto const icase = v.get("icase", false);
    if (!icase.isBool())
      throw config_error(fmt::format("{}.icase must be a boolean", where));
    return Pattern(rx, icase.asBool());
  }

  throw config_error(fmt::format("{} must be a string or regex object", where));
}

std::vector<Pattern> get_patterns(Json::Value const& v, std::string_view where)
{
  if (!v.isArray())
    throw config_error(fmt::format("{} must be an array", where));

  std::vector<Pattern> pats;
  for (Json::ArrayIndex i = 0; i < v.size(); ++i)
    pats.push_back(get_pattern(v[i], fmt::format("{}[{}]", where, i)));
  return pats;
}

std::vector<std::string> get_strings(Json::Value const& v,
                                     std::string_view   where)
{
  if (!v.isArray())
    throw config_error(fmt::format("{} must be an array", where));

  std::vector<std::string> strs;
  for (Json::ArrayIndex i = 0; i < v.size(); ++i)
    strs.push_back(get_string(v[i], fmt::format("{}[{}]", where, i)));
  return strs;
}

Rule get_rule(Json::Value const& v, Json::ArrayIndex idx)
{
  auto const where = fmt::format("rules[{}]", idx);

  if (!v.isObject())
    throw config_error(fmt::format("{} must be an object", where));

  auto const n_match = v.isMember(Match_exact) + v.isMember(Match_host) +
                       v.isMember(Match_pattern);
  if (n_match != 1)
    throw config_error(
        fmt::format("{} needs exactly one of {}, {}, {}; has {}", where,
                    Match_exact, Match_host, Match_pattern, n_match));

  Rule rule;

  if (v.isMember(Match_exact)) {
    rule.match = Rule::exact{
        get_string(v[Match_exact], fmt::format("{}.{}", where, Match_exact))};
  }
  else if (v.isMember(Match_host)) {
    rule.match = Rule::host{
        get_string(v[Match_host], fmt::format("{}.{}", where, Match_host))};
  }
  else {
    rule.match = get_pattern(v[Match_pattern],
                             fmt::format("{}.{}", where, Match_pattern));
  }

  if (v.isMember(Reject_users)) {
    rule.reject_users = get_strings(v[Reject_users],
                                    fmt::format("{}.{}", where, Reject_users));
    for (auto& user : rule.reject_users)
      boost::algorithm::to_lower(user);
  }

  if (v.isMember(Reject_pattern)) {
    rule.reject_pattern = get_pattern(
        v[Reject_pattern], fmt::format("{}.{}", where, Reject_pattern));
  }

  if (v.isMember(Reject_if_subject)) {
    rule.reject_subject = get_patterns(
        v[Reject_if_subject], fmt::format("{}.{}", where, Reject_if_subject));
  }

  if (v.isMember(Allow_all)) {
    if (!v[Allow_all].isBool())
      throw config_error(
          fmt::format("{}.{} must be a boolean", where, Allow_all));
    rule.allow_all = v[Allow_all].asBool();
  }

  if (!v.isMember(Recipients))
    throw config_error(fmt::format("{} has no {}", where, Recipients));
  rule.recipients =
      get_strings(v[Recipients], fmt::format("{}.{}", where, Recipients));
  if (rule.recipients.empty())
    throw config_error(fmt::format("{}.{} is empty", where, Recipients));

  return rule;
}

} // namespace

Config Config::from_json(Json::Value const& root)
{
  if (!root.isObject())
    throw config_error("config must be a JSON object");

  Config cfg;

  if (root.isMember(Postmaster))
    cfg.postmaster = get_string(root[Postmaster], Postmaster);

  if (root.isMember(Store_prefix))
    cfg.store_prefix = get_string(root[Store_prefix], Store_prefix);

  if (root.isMember(Global_rules)) {
    auto const& g = root[Global_rules];
    if (!g.isObject())
      throw config_error(fmt::format("{} must be an object", Global_rules));
    if (g.isMember(Reject_if_subject))
      cfg.globals.subject = get_patterns(
          g[Reject_if_subject],
          fmt::format("{}.{}", Global_rules, Reject_if_subject));
    if (g.isMember(Reject_if_body))
      cfg.globals.body =
          get_patterns(g[Reject_if_body],
                       fmt::format("{}.{}", Global_rules, Reject_if_body));
  }

  if (!root.isMember(Rules))
    throw config_error("config has no rules");
  auto const& rules = root[Rules];
  if (!rules.isArray())
    throw config_error("rules must be an array");

  for (Json::ArrayIndex i = 0; i < rules.size(); ++i)
    cfg.rules.push_back(get_rule(rules[i], i));

  LOG(INFO) << "loaded " << cfg.rules.size() << " rules, "
            << cfg.globals.subject.size() << " global subject rejects, "
            << cfg.globals.body.size() << " global body rejects";

  return cfg;
}

Config Config::parse(std::string_view json_text)
{
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;

  std::unique_ptr<Json::CharReader> const reader(builder.newCharReader());

  Json::Value root;
  std::string errs;
  if (!reader->parse(json_text.data(), json_text.data() + json_text.size(),
                     &root, &errs)) {
    throw config_error(fmt::format("config is not valid JSON: {}", errs));
  }

  return from_json(root);
}

Config Config::load(fs::path const& path)
{
  if (!fs::exists(path))
    throw config_error(fmt::format("can't find config file {}", path.string()));

  LOG(INFO) << "loading config from " << path;

  std::string text;
  try {
    text = osutil::read_file(path);
  }
  catch (std::exception const& e) {
    throw config_error(
        fmt::format("can't read config file {}: {}", path.string(), e.what()));
  }

  return parse(text);
}
