#include "rewriter.hpp"
#include "classify/classifier.hpp"
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <spdlog/spdlog.h>

namespace eolnorm::rewrite {

namespace fs = std::filesystem;

namespace {

constexpr int kTempPathAttempts = 8;

void discard(const fs::path &temp) {
    std::error_code ec;
    fs::remove(temp, ec);
    if (ec) {
        spdlog::warn("Failed to remove temporary file {}: {}", temp.string(), ec.message());
    }
}

} // namespace

fs::path make_temp_path(const fs::path &target) {
    static std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> distribution;

    // Leading dot keeps the file out of a walk that skips hidden entries
    std::ostringstream name;
    name << "." << target.filename().string() << ".eolnorm-" << std::hex << distribution(generator);
    return target.parent_path() / name.str();
}

std::string rewrite(const std::string &bytes, LoneCr lone_cr) {
    std::string result;
    result.reserve(bytes.size());

    for (size_t i = 0; i < bytes.size(); ++i) {
        if (bytes[i] != '\r') {
            result.push_back(bytes[i]);
            continue;
        }

        if (i + 1 < bytes.size() && bytes[i + 1] == '\n') {
            result.push_back('\n');
            ++i;
        } else if (lone_cr == LoneCr::Convert) {
            result.push_back('\n');
        } else {
            result.push_back('\r');
        }
    }

    return result;
}

bool needs_conversion(const std::string &bytes, LoneCr lone_cr) {
    if (classify::contains_crlf(bytes)) {
        return true;
    }
    return lone_cr == LoneCr::Convert && classify::contains_lone_cr(bytes);
}

void replace_file_atomically(const fs::path &target, const std::string &content,
                             const TempPathGenerator &temp_path) {
    std::error_code ec;
    const auto original_status = fs::status(target, ec);
    if (ec) {
        throw std::runtime_error("Failed to stat " + target.string() + ": " + ec.message());
    }

    fs::path temp;
    bool found = false;
    for (int attempt = 0; attempt < kTempPathAttempts && !found; ++attempt) {
        temp = temp_path(target);
        found = fs::symlink_status(temp, ec).type() == fs::file_type::not_found;
    }
    if (!found) {
        throw std::runtime_error("No free temporary name next to " + target.string());
    }

    {
        std::ofstream out(temp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Failed to create temporary file " + temp.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (out.fail()) {
            discard(temp);
            throw std::runtime_error("Failed to write temporary file " + temp.string());
        }
    }

    fs::permissions(temp, original_status.permissions(), fs::perm_options::replace, ec);
    if (ec) {
        discard(temp);
        throw std::runtime_error("Failed to copy permissions to " + temp.string() + ": " + ec.message());
    }

    fs::rename(temp, target, ec);
    if (ec) {
        discard(temp);
        throw std::runtime_error("Failed to replace " + target.string() + ": " + ec.message());
    }

    spdlog::debug("Replaced {} ({} bytes)", target.string(), content.size());
}

} // namespace eolnorm::rewrite
