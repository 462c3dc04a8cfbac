#include "filesystem.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace eolnorm::utils {

namespace fs = std::filesystem;

std::string read_file_bytes(const fs::path &file_path) {
    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path.string());
    }

    std::string content = buffer.str();
    std::error_code ec;
    const auto expected = fs::file_size(file_path, ec);
    if (ec) {
        throw std::runtime_error("Failed to stat " + file_path.string() + ": " + ec.message());
    }
    if (content.size() != expected) {
        throw std::runtime_error("Short read on " + file_path.string() + ": got " +
                                 std::to_string(content.size()) + " of " + std::to_string(expected) + " bytes");
    }
    return content;
}

std::vector<fs::directory_entry> list_entries(const fs::path &dir_path) {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;

    for (fs::directory_iterator it(dir_path, ec), end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        entries.push_back(*it);
    }
    if (ec) {
        throw fs::filesystem_error("Failed to list directory", dir_path, ec);
    }

    std::sort(entries.begin(), entries.end(), [](const auto &a, const auto &b) {
        return a.path().filename().string() < b.path().filename().string();
    });
    return entries;
}

bool is_hidden(const fs::path &path) {
    const std::string name = path.filename().string();
    return !name.empty() && name != "." && name != ".." && name[0] == '.';
}

std::string normalize_extension(const std::string &extension) {
    std::string ext = extension;
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

std::set<std::string> normalize_extensions(const std::vector<std::string> &extensions) {
    std::set<std::string> normalized;
    for (const auto &ext : extensions) {
        auto value = normalize_extension(ext);
        if (!value.empty()) {
            normalized.insert(std::move(value));
        }
    }
    return normalized;
}

bool has_listed_extension(const fs::path &path, const std::set<std::string> &extensions) {
    std::string ext = path.extension().string();
    if (ext.empty()) return false;

    return extensions.count(normalize_extension(ext)) != 0;
}

} // namespace eolnorm::utils
