// Verify email addresses given on the command line, one report per
// address on stdout.  Exits non-zero if any address doesn't look
// deliverable.

#include "Errors.hpp"
#include "Verifier.hpp"
#include "osutil.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include <gflags/gflags.h>

// clang-format off
DEFINE_bool(offline, false, "use only local data files, no network checks");
DEFINE_string(data_dir, "", "directory holding the data files for --offline");
DEFINE_int32(http_timeout_ms, 10'000, "timeout for each HTTP request step");

DEFINE_bool(registrability, true, "check for a registrable domain");
DEFINE_string(psl_url, "", "public suffix list URL");
DEFINE_string(psl_file, "", "public suffix list file");
DEFINE_string(psl_rules, "", "extra suffix rules, comma separated");

DEFINE_bool(disposable, true, "check for disposable mail domains");
DEFINE_string(disposable_url, "", "disposable domain list URL");
DEFINE_string(disposable_file, "", "disposable domain list file");
DEFINE_string(disposable_allow, "", "domains never disposable, comma separated");
DEFINE_string(disposable_deny, "", "domains always disposable, comma separated");

DEFINE_bool(free, true, "check for free mail providers");
DEFINE_string(free_url, "", "free provider domain list URL");
DEFINE_string(free_file, "", "free provider domain list file");
DEFINE_string(free_allow, "", "domains never free, comma separated");
DEFINE_string(free_deny, "", "domains always free, comma separated");

DEFINE_bool(role_based, true, "check for role account usernames");
DEFINE_string(role_url, "", "role username list URL");
DEFINE_string(role_file, "", "role username list file");
DEFINE_string(role_allow, "", "usernames never role based, comma separated");
DEFINE_string(role_deny, "", "usernames always role based, comma separated");

DEFINE_bool(mx, true, "look up mail exchangers");
DEFINE_string(doh_endpoint, Config::doh_endpoint_default, "DNS-over-HTTPS JSON endpoint");

DEFINE_bool(avatar, true, "look for an avatar");
DEFINE_string(avatar_endpoint, Config::avatar_endpoint_default, "avatar service base URL");

DEFINE_bool(smtp, false, "probe the mail exchangers over SMTP");
DEFINE_bool(catch_all, true, "check whether the exchanger accepts any address");
DEFINE_int32(smtp_timeout_ms, 5'000, "timeout for each SMTP read or write");
DEFINE_int32(smtp_retries, Config::smtp_retries_default, "attempts per mail exchanger");
DEFINE_int32(smtp_port, Config::smtp_port_default, "SMTP port");
DEFINE_string(helo_domain, Config::helo_domain_default, "domain given in HELO");
DEFINE_string(probe_sender, Config::probe_sender_default, "MAIL FROM address");
DEFINE_string(proxy, "", "SOCKS5 proxy as host or host:port");
// clang-format on

#include <glog/logging.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast.hpp>

namespace {
bool validate_positive(const char* flagname, int32_t value)
{
  if (value > 0)
    return true;
  LOG(ERROR) << "--" << flagname << " must be positive";
  return false;
}

DEFINE_validator(http_timeout_ms, &validate_positive);
DEFINE_validator(smtp_timeout_ms, &validate_positive);
DEFINE_validator(smtp_retries, &validate_positive);

bool validate_port(const char* flagname, int32_t value)
{
  if ((value > 0) && (value <= 65535))
    return true;
  LOG(ERROR) << "--" << flagname << " must be a port number";
  return false;
}

DEFINE_validator(smtp_port, &validate_port);

std::vector<std::string> split_list(std::string const& value)
{
  std::vector<std::string> items;
  if (value.empty())
    return items;
  boost::algorithm::split(items, value, boost::algorithm::is_any_of(","));
  return items;
}

void set_list(Config::List_settings& list,
              bool                   enabled,
              std::string const&     url,
              std::string const&     file,
              std::string const&     allow,
              std::string const&     deny)
{
  list.enabled = enabled;
  Config::set_source(list.source, url, file);
  list.allow = split_list(allow);
  list.deny  = split_list(deny);
}

// host or host:port
void set_proxy(Config::SMTP_settings& smtp, std::string const& proxy)
{
  if (proxy.empty())
    return;
  auto const colon = proxy.rfind(':');
  if (colon == std::string::npos) {
    smtp.proxy_host = proxy;
    return;
  }
  smtp.proxy_host = proxy.substr(0, colon);
  try {
    smtp.proxy_port = boost::lexical_cast<uint16_t>(proxy.substr(colon + 1));
  }
  catch (boost::bad_lexical_cast const&) {
    throw std::invalid_argument("bad proxy port in --proxy=" + proxy);
  }
}

Config::Settings settings_from_flags()
{
  Config::Settings settings;

  settings.all_offline = FLAGS_offline;
  settings.data_dir    = FLAGS_data_dir.empty() ? osutil::get_cache_dir()
                                                : fs::path(FLAGS_data_dir);
  settings.http_timeout = std::chrono::milliseconds(FLAGS_http_timeout_ms);

  settings.registrability.enabled = FLAGS_registrability;
  Config::set_source(settings.registrability.source, FLAGS_psl_url,
                     FLAGS_psl_file);
  settings.registrability.custom_rules = split_list(FLAGS_psl_rules);

  set_list(settings.disposable, FLAGS_disposable, FLAGS_disposable_url,
           FLAGS_disposable_file, FLAGS_disposable_allow,
           FLAGS_disposable_deny);
  set_list(settings.free, FLAGS_free, FLAGS_free_url, FLAGS_free_file,
           FLAGS_free_allow, FLAGS_free_deny);
  set_list(settings.role_based, FLAGS_role_based, FLAGS_role_url,
           FLAGS_role_file, FLAGS_role_allow, FLAGS_role_deny);

  settings.mx.enabled      = FLAGS_mx;
  settings.mx.doh_endpoint = FLAGS_doh_endpoint;

  settings.avatar.enabled  = FLAGS_avatar;
  settings.avatar.endpoint = FLAGS_avatar_endpoint;

  auto& smtp           = settings.smtp;
  smtp.enabled         = FLAGS_smtp;
  smtp.catch_all_check = FLAGS_catch_all;
  smtp.timeout         = std::chrono::milliseconds(FLAGS_smtp_timeout_ms);
  smtp.max_retries     = FLAGS_smtp_retries;
  smtp.port            = static_cast<uint16_t>(FLAGS_smtp_port);
  smtp.helo_domain     = FLAGS_helo_domain;
  smtp.sender          = FLAGS_probe_sender;
  set_proxy(smtp, FLAGS_proxy);

  return settings;
}
} // namespace

int main(int argc, char* argv[])
{
  std::ios::sync_with_stdio(false);

  { // Need to work with either namespace.
    using namespace gflags;
    using namespace google;
    SetUsageMessage("mailverify [flags] address...");
    ParseCommandLineFlags(&argc, &argv, true);
  }
  google::InitGoogleLogging(argv[0]);

  if (argc < 2) {
    LOG(ERROR) << "no addresses given";
    return 2;
  }

  auto verifier = [] {
    try {
      return Verifier::create(settings_from_flags());
    }
    catch (std::invalid_argument const& e) {
      LOG(ERROR) << "bad configuration: " << e.what();
      std::exit(2);
    }
    catch (ConnectionError const& e) {
      LOG(ERROR) << "can't load data: " << e.what();
      std::exit(3);
    }
  }();

  auto all_deliverable = true;
  for (int a = 1; a < argc; ++a) {
    auto const res = verifier.verify(argv[a]);
    std::cout << res;
    if (!res.likely_deliverable())
      all_deliverable = false;
  }
  std::cout << std::flush;

  return all_deliverable ? EXIT_SUCCESS : EXIT_FAILURE;
}
