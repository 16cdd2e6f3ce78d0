#ifndef FS_DOT_HPP
#define FS_DOT_HPP

#include <filesystem>
namespace fs = std::filesystem;

#endif // FS_DOT_HPP
