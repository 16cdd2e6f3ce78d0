#ifndef CONFIG_DOT_HPP
#define CONFIG_DOT_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "Avatar.hpp"
#include "DNS.hpp"
#include "HTTP.hpp"
#include "Probe.hpp"
#include "fs.hpp"

namespace Config {

constexpr char const* psl_url_default
    = "https://publicsuffix.org/list/public_suffix_list.dat";
constexpr char const* disposable_url_default
    = "https://raw.githubusercontent.com/disposable/"
      "disposable-email-domains/master/domains_strict.txt";
constexpr char const* free_url_default
    = "https://gist.githubusercontent.com/okutbay/"
      "5b4974b70673dfdcc21c517632c1f984/raw/"
      "daa988474b832059612f1b2468fba6cfcd2390dd/"
      "free_email_provider_domains.txt";
constexpr char const* role_url_default
    = "https://raw.githubusercontent.com/mbalatsko/"
      "role-based-email-addresses-list/main/list.txt";

// File names under data_dir when working offline.
constexpr char const* psl_file_default        = "public_suffix_list.dat";
constexpr char const* disposable_file_default = "disposable_domains.txt";
constexpr char const* free_file_default       = "free_domains.txt";
constexpr char const* role_file_default       = "role_usernames.txt";

constexpr uint16_t socks5_port_default = 1080;

// Where a dataset comes from: a URL or a file, not both.
struct Source {
  std::string url;
  fs::path    file;
};

struct Registrability_settings {
  bool                     enabled{true};
  Source                   source{psl_url_default, {}};
  std::vector<std::string> custom_rules;
};

struct List_settings {
  bool                     enabled{true};
  Source                   source;
  std::vector<std::string> allow;
  std::vector<std::string> deny;
};

struct MX_settings {
  bool        enabled{true};
  std::string doh_endpoint{doh_endpoint_default};
};

struct Avatar_settings {
  bool        enabled{true};
  std::string endpoint{avatar_endpoint_default};
};

struct SMTP_settings {
  bool                      enabled{false};
  bool                      catch_all_check{true};
  std::chrono::milliseconds timeout{smtp_timeout_default};
  int                       max_retries{smtp_retries_default};
  std::string               proxy_host; // empty for a direct connection
  uint16_t                  proxy_port{socks5_port_default};
  std::string               helo_domain{helo_domain_default};
  std::string               sender{probe_sender_default};
  uint16_t                  port{smtp_port_default};
};

struct Settings {
  bool                      all_offline{false};
  fs::path                  data_dir;
  std::chrono::milliseconds http_timeout{http_timeout_default};

  Registrability_settings registrability;
  List_settings           disposable{true, {disposable_url_default, {}}, {}, {}};
  List_settings           free{true, {free_url_default, {}}, {}, {}};
  List_settings           role_based{true, {role_url_default, {}}, {}, {}};
  MX_settings             mx;
  Avatar_settings         avatar;
  SMTP_settings           smtp;
};

// Override a default source: a file alone replaces the URL, and a
// URL and a file together are both kept for validate() to reject.
void set_source(Source& source, std::string const& url, fs::path const& file);

// Check the settings for consistency and apply all_offline.  Throws
// std::invalid_argument describing the first problem found.
void validate(Settings& settings);

} // namespace Config

#endif // CONFIG_DOT_HPP
