#include "osutil.hpp"

#include <cerrno>
#include <cstdlib>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

#include <glog/logging.h>

namespace osutil {

fs::path get_home_dir()
{
  auto const homedir_ev{getenv("HOME")};
  if (homedir_ev && *homedir_ev)
    return homedir_ev;

  errno = 0; // See GETPWNAM(3)
  passwd* pw;
  PCHECK(pw = getpwuid(getuid()));
  return pw->pw_dir;
}

fs::path get_cache_dir()
{
  auto const cache_ev{getenv("XDG_CACHE_HOME")};
  if (cache_ev && *cache_ev)
    return fs::path(cache_ev) / "mailverify";
  return get_home_dir() / ".cache" / "mailverify";
}

} // namespace osutil
