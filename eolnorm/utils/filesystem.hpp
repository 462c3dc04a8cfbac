#ifndef EOLNORM_UTILS_FILESYSTEM_HPP
#define EOLNORM_UTILS_FILESYSTEM_HPP

#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace eolnorm::utils {

// File reading operations
// Throws when the bytes read do not match the size reported by the filesystem
std::string read_file_bytes(const std::filesystem::path &file_path);

// Directory operations
// Entries of one directory, sorted by file name. Throws on failure.
std::vector<std::filesystem::directory_entry> list_entries(const std::filesystem::path &directory_path);

// Name checks
bool is_hidden(const std::filesystem::path &path);

// Extensions are compared lower-cased and without the leading dot,
// so "RS", ".rs" and "rs" are the same entry.
std::string normalize_extension(const std::string &extension);
std::set<std::string> normalize_extensions(const std::vector<std::string> &extensions);
bool has_listed_extension(const std::filesystem::path &path, const std::set<std::string> &extensions);

} // namespace eolnorm::utils

#endif // EOLNORM_UTILS_FILESYSTEM_HPP
