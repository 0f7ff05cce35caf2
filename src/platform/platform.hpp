#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), falling back to the temp dir.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Expands a leading "~/" against home_dir().
std::filesystem::path expand_user(const std::string& path);

// Restricts a file to owner read/write (0600). Returns false on failure.
bool restrict_to_owner(const std::filesystem::path& path);

} // namespace platform
