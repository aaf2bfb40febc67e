// modgraph/io/content_source.cpp - Filesystem and cached content sources
#include "modgraph/io/content_source.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "modgraph/basic/errors.hpp"
#include "modgraph/basic/log.hpp"

namespace modgraph
{

std::string FileContentSource::read(const std::string & path)
{
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw NotFoundError(path);
  }

  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw NotFoundError(path);
  }

  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

CachingContentSource::CachingContentSource(std::unique_ptr<ContentSource> inner, size_t max_entries)
: inner_(std::move(inner)), cache_(max_entries)
{
}

std::string CachingContentSource::read(const std::string & path)
{
  if (auto hit = cache_.get(path)) {
    log::cache()->trace("content hit {}", path);
    return std::move(*hit);
  }

  auto text = inner_->read(path);
  cache_.set(path, text);
  return text;
}

}  // namespace modgraph
