#ifndef PROVIDER_DOT_HPP
#define PROVIDER_DOT_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "fs.hpp"

namespace HTTP {
class Fetcher;
}

// Source of a line oriented list: host names, usernames, or suffix
// rules.  One entry per line; empty lines and lines starting with "//"
// are ignored, the rest are trimmed, lower cased and converted to
// ASCII compatible encoding.

class Provider {
public:
  virtual ~Provider() = default;

  // Where the data comes from, for log messages.
  virtual std::string name() const = 0;

  // Raw text; throws ConnectionError if it can't be had.
  virtual std::string obtain() = 0;

  // Normalized entries, duplicates removed, in the order first seen.
  std::vector<std::string> provide();
};

std::vector<std::string> normalize_list(std::string_view text);

class FileProvider : public Provider {
public:
  explicit FileProvider(fs::path path)
    : path_(std::move(path))
  {
  }

  std::string name() const override { return path_.string(); }
  std::string obtain() override;

private:
  fs::path path_;
};

class URLProvider : public Provider {
public:
  URLProvider(std::string url, std::shared_ptr<HTTP::Fetcher> fetcher)
    : url_(std::move(url))
    , fetcher_(std::move(fetcher))
  {
  }

  std::string name() const override { return url_; }
  std::string obtain() override;

private:
  std::string                    url_;
  std::shared_ptr<HTTP::Fetcher> fetcher_;
};

class FixedProvider : public Provider {
public:
  explicit FixedProvider(std::vector<std::string> lines)
    : lines_(std::move(lines))
  {
  }

  std::string name() const override { return "fixed list"; }
  std::string obtain() override;

private:
  std::vector<std::string> lines_;
};

#endif // PROVIDER_DOT_HPP
