#ifndef OSUTIL_DOT_HPP_INCLUDED
#define OSUTIL_DOT_HPP_INCLUDED

#include "fs.hpp"

namespace osutil {
fs::path get_home_dir();

// Where downloaded lists are kept for offline use: $XDG_CACHE_HOME or
// ~/.cache, then "mailverify".
fs::path get_cache_dir();
} // namespace osutil

#endif // OSUTIL_DOT_HPP_INCLUDED
