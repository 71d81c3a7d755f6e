#pragma once
#include <filesystem>
#include <string>

namespace shipit::fs {

// Any directory entry, following symlinks (a dangling link does not exist).
bool exists(const std::filesystem::path& p);
// The entry itself is a symbolic link, whether or not its target exists.
bool is_symlink(const std::filesystem::path& p);

std::string read_file(const std::filesystem::path& p);

} // namespace shipit::fs
