#include "Config.hpp"

#include <iostream>
#include <stdexcept>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
bool rejects(Config::Settings settings)
{
  try {
    Config::validate(settings);
  }
  catch (std::invalid_argument const& e) {
    LOG(INFO) << "expected: " << e.what();
    return true;
  }
  return false;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  {
    // The defaults are valid as they stand.
    Config::Settings settings;
    Config::validate(settings);
    CHECK(settings.registrability.enabled);
    CHECK(settings.mx.enabled);
    CHECK(settings.avatar.enabled);
    CHECK(!settings.smtp.enabled);
    CHECK_EQ(settings.disposable.source.url,
             std::string(Config::disposable_url_default));
    CHECK(settings.disposable.source.file.empty());
    CHECK_EQ(settings.smtp.port, 25);
    CHECK_EQ(settings.smtp.max_retries, 2);
    CHECK_EQ(settings.smtp.proxy_port, 1080);
  }

  {
    // A file and a URL for the same dataset.
    Config::Settings settings;
    settings.free.source.file = "/tmp/free.txt";
    CHECK(rejects(settings));

    // Even when the dataset is switched off.
    settings.free.enabled = false;
    CHECK(rejects(settings));
  }

  {
    // No source at all.
    Config::Settings settings;
    settings.role_based.source = {};
    CHECK(rejects(settings));

    settings.role_based.enabled = false;
    CHECK(!rejects(settings));
  }

  {
    // Overriding the default source.
    Config::Settings settings;
    Config::set_source(settings.registrability.source, "", "/srv/psl.dat");
    CHECK(settings.registrability.source.url.empty());
    CHECK_EQ(settings.registrability.source.file, fs::path("/srv/psl.dat"));

    Config::set_source(settings.free.source, "https://lists.example/free",
                       "");
    CHECK_EQ(settings.free.source.url, "https://lists.example/free"s);
    CHECK(settings.free.source.file.empty());

    // Nothing given, nothing changes.
    Config::set_source(settings.role_based.source, "", "");
    CHECK_EQ(settings.role_based.source.url,
             std::string(Config::role_url_default));
    CHECK(!rejects(settings));

    // Both given: kept, and rejected.
    Config::set_source(settings.disposable.source,
                       "https://lists.example/disposable",
                       "/srv/disposable.txt");
    CHECK_EQ(settings.disposable.source.url,
             "https://lists.example/disposable"s);
    CHECK_EQ(settings.disposable.source.file,
             fs::path("/srv/disposable.txt"));
    CHECK(rejects(settings));
  }

  {
    // A file replaces the URL.
    Config::Settings settings;
    settings.disposable.source = {"", "/srv/lists/disposable.txt"};
    Config::validate(settings);
    CHECK_EQ(settings.disposable.source.file,
             fs::path("/srv/lists/disposable.txt"));
    CHECK(settings.disposable.source.url.empty());
  }

  {
    // Offline: network checks off, URL sources switched to files in
    // data_dir, explicit files kept.
    Config::Settings settings;
    settings.all_offline  = true;
    settings.data_dir     = "/var/cache/mailverify";
    settings.smtp.enabled = true;
    settings.free.source  = {"", "/srv/lists/free.txt"};
    Config::validate(settings);

    CHECK(!settings.mx.enabled);
    CHECK(!settings.avatar.enabled);
    CHECK(!settings.smtp.enabled);

    CHECK(settings.registrability.source.url.empty());
    CHECK_EQ(settings.registrability.source.file,
             fs::path("/var/cache/mailverify/public_suffix_list.dat"));
    CHECK_EQ(settings.disposable.source.file,
             fs::path("/var/cache/mailverify/disposable_domains.txt"));
    CHECK_EQ(settings.role_based.source.file,
             fs::path("/var/cache/mailverify/role_usernames.txt"));
    CHECK_EQ(settings.free.source.file, fs::path("/srv/lists/free.txt"));
  }

  {
    // Offline with nowhere to find the files.
    Config::Settings settings;
    settings.all_offline = true;
    CHECK(rejects(settings));

    // Fine if every enabled dataset names its file.
    settings.registrability.source = {"", "/srv/psl.dat"};
    settings.disposable.source     = {"", "/srv/disposable.txt"};
    settings.free.enabled          = false;
    settings.role_based.enabled    = false;
    CHECK(!rejects(settings));
  }

  {
    Config::Settings settings;
    settings.smtp.timeout = std::chrono::milliseconds(0);
    CHECK(rejects(settings));
  }

  {
    Config::Settings settings;
    settings.smtp.max_retries = 0;
    CHECK(rejects(settings));
  }

  {
    Config::Settings settings;
    settings.http_timeout = std::chrono::milliseconds(-1);
    CHECK(rejects(settings));
  }

  {
    // SMTP without MX is allowed, just useless.
    Config::Settings settings;
    settings.smtp.enabled = true;
    settings.mx.enabled   = false;
    CHECK(!rejects(settings));
  }

  std::cout << "all config checks passed\n";
}
