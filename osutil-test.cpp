#include "osutil.hpp"

#include <cstdlib>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(setenv("HOME", "/home/someone", 1), 0);
  CHECK_EQ(osutil::get_home_dir(), fs::path("/home/someone"));

  CHECK_EQ(unsetenv("XDG_CACHE_HOME"), 0);
  CHECK_EQ(osutil::get_cache_dir(),
           fs::path("/home/someone/.cache/mailverify"));

  CHECK_EQ(setenv("XDG_CACHE_HOME", "/var/cache", 1), 0);
  CHECK_EQ(osutil::get_cache_dir(), fs::path("/var/cache/mailverify"));

  // An empty variable is the same as none.
  CHECK_EQ(setenv("XDG_CACHE_HOME", "", 1), 0);
  CHECK_EQ(osutil::get_cache_dir(),
           fs::path("/home/someone/.cache/mailverify"));

  // Without HOME, the password database.
  CHECK_EQ(unsetenv("HOME"), 0);
  CHECK(!osutil::get_home_dir().empty());
}
