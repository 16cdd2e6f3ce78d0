#include "Provider.hpp"

#include "Domain.hpp"
#include "Errors.hpp"
#include "HTTP.hpp"
#include "imemstream.hpp"

#include <unordered_set>

#include <glog/logging.h>

#include <fmt/format.h>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/iostreams/device/mapped_file.hpp>

std::vector<std::string> normalize_list(std::string_view text)
{
  std::vector<std::string>        entries;
  std::unordered_set<std::string> seen;

  imemstream  stream{text};
  std::string line;
  while (std::getline(stream, line)) {
    if (line.empty() || boost::starts_with(line, "//"))
      continue;
    boost::algorithm::trim(line);
    if (line.empty())
      continue;
    std::string entry;
    try {
      entry = domain::to_ascii(line);
    }
    catch (FormatError const& e) {
      LOG(WARNING) << "skipping list entry: " << e.what();
      continue;
    }
    if (seen.insert(entry).second)
      entries.push_back(std::move(entry));
  }

  return entries;
}

std::vector<std::string> Provider::provide()
{
  auto const text    = obtain();
  auto       entries = normalize_list(text);
  LOG(INFO) << "loaded " << entries.size() << " entries from " << name();
  return entries;
}

std::string FileProvider::obtain()
{
  std::error_code ec;
  auto const      size = fs::file_size(path_, ec);
  if (ec) {
    throw ConnectionError(
        fmt::format("can't read {}: {}", path_.string(), ec.message()));
  }
  if (size == 0)
    return std::string{};

  try {
    boost::iostreams::mapped_file_source file{path_.string()};
    return std::string(file.data(), file.size());
  }
  catch (std::ios_base::failure const& e) {
    throw ConnectionError(
        fmt::format("can't map {}: {}", path_.string(), e.what()));
  }
}

std::string URLProvider::obtain()
{
  auto const rsp = fetcher_->get(url_);
  if (rsp.status >= 400) {
    throw ConnectionError(
        fmt::format("failed to fetch {}: HTTP status {}", url_, rsp.status));
  }
  VLOG(1) << "fetched " << rsp.body.size() << " octets from " << url_;
  return rsp.body;
}

std::string FixedProvider::obtain()
{
  return boost::algorithm::join(lines_, "\n");
}
