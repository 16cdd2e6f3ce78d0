#include "Config.hpp"

#include <stdexcept>

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
void validate_source(char const*     name,
                     bool            enabled,
                     Config::Source& source,
                     char const*     file_default,
                     bool            offline,
                     fs::path const& data_dir)
{
  if (!source.url.empty() && !source.file.empty()) {
    throw std::invalid_argument(
        fmt::format("{}: both a URL and a file given", name));
  }
  if (!enabled)
    return;

  if (offline && source.file.empty()) {
    if (data_dir.empty()) {
      throw std::invalid_argument(
          fmt::format("{}: working offline needs a file or a data directory",
                      name));
    }
    source.url.clear();
    source.file = data_dir / file_default;
    VLOG(1) << name << " from " << source.file;
  }

  if (source.url.empty() && source.file.empty()) {
    throw std::invalid_argument(
        fmt::format("{}: no URL or file given", name));
  }
}
} // namespace

namespace Config {

void set_source(Source& source, std::string const& url, fs::path const& file)
{
  if (!url.empty())
    source.url = url;
  if (!file.empty()) {
    source.file = file;
    if (url.empty())
      source.url.clear();
  }
}

void validate(Settings& settings)
{
  auto const offline = settings.all_offline;

  if (offline) {
    settings.mx.enabled     = false;
    settings.avatar.enabled = false;
    settings.smtp.enabled   = false;
  }

  validate_source("registrability", settings.registrability.enabled,
                  settings.registrability.source, psl_file_default, offline,
                  settings.data_dir);
  validate_source("disposable", settings.disposable.enabled,
                  settings.disposable.source, disposable_file_default,
                  offline, settings.data_dir);
  validate_source("free", settings.free.enabled, settings.free.source,
                  free_file_default, offline, settings.data_dir);
  validate_source("role_based", settings.role_based.enabled,
                  settings.role_based.source, role_file_default, offline,
                  settings.data_dir);

  if (settings.smtp.enabled && !settings.mx.enabled) {
    LOG(WARNING) << "SMTP probe needs MX records, it will always be skipped";
  }
  if (settings.smtp.timeout <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("smtp: timeout must be positive");
  }
  if (settings.smtp.max_retries < 1) {
    throw std::invalid_argument("smtp: max_retries must be at least 1");
  }
  if (settings.http_timeout <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("http_timeout must be positive");
  }
}

} // namespace Config
