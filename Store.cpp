#include "Store.hpp"

#include "errors.hpp"

#include <fmt/format.h>

#include <glog/logging.h>


std::string DirStore::url(std::string_view location) const
{
  return (root_ / location).string();
}

std::string DirStore::fetch(std::string_view location)
{
  auto const path = root_ / location;

  LOG(INFO) << "fetching mail content from " << path;

  std::string content;
  try {
    content = osutil::read_file(path);
  }
  catch (std::exception const& e) {
    throw retrieval_error(fmt::format(
        "failed to get mail content from <{}>: {}", path.string(), e.what()));
  }

  if (content.empty())
    throw retrieval_error(fmt::format(
        "failed to get mail content from <{}>: empty object", path.string()));

  return content;
}

std::string MemStore::fetch(std::string_view location)
{
  ++fetches_;

  auto const obj = objects_.find(location);
  if (obj == objects_.end())
    throw retrieval_error(fmt::format("no such object <{}>", location));
  if (obj->second.empty())
    throw retrieval_error(fmt::format("empty object <{}>", location));

  return obj->second;
}
