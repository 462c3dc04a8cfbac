#ifndef EOLNORM_REWRITE_REWRITER_HPP
#define EOLNORM_REWRITE_REWRITER_HPP

#pragma once

#include <filesystem>
#include <functional>
#include <string>

namespace eolnorm::rewrite {

// What to do with a CR that is not followed by LF
enum class LoneCr {
    Preserve,
    Convert
};

// Replaces every CRLF with LF. All other bytes keep their order and count,
// except lone CRs which become LF under LoneCr::Convert.
std::string rewrite(const std::string &bytes, LoneCr lone_cr = LoneCr::Preserve);

// True when rewrite() would change the content
bool needs_conversion(const std::string &bytes, LoneCr lone_cr = LoneCr::Preserve);

// Produces a candidate temporary path next to target
using TempPathGenerator = std::function<std::filesystem::path(const std::filesystem::path &target)>;

// Random hidden sibling name: ".<name>.eolnorm-<hex>"
std::filesystem::path make_temp_path(const std::filesystem::path &target);

// Writes content to a temporary sibling of target and renames it over target.
// An existing file is never reused as the temporary. On failure the temporary
// file is removed, target is left as it was and std::runtime_error is thrown.
void replace_file_atomically(const std::filesystem::path &target, const std::string &content,
                             const TempPathGenerator &temp_path = make_temp_path);

} // namespace eolnorm::rewrite

#endif // EOLNORM_REWRITE_REWRITER_HPP
