#include "classifier.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace eolnorm::classify {
namespace {

bool is_suspicious(unsigned char c) {
    if (c >= 0x80) {
        return false;
    }
    if (c == 0x7f) {
        return true;
    }
    if (c >= 0x20) {
        return false;
    }

    switch (c) {
    case '\t':
    case '\n':
    case '\v':
    case '\f':
    case '\r':
    case '\b':
    case 0x1b: // ESC, used by terminal color codes in logs
        return false;
    default:
        return true;
    }
}

} // namespace

FileKind classify(const std::string &bytes, const ClassifierOptions &options) {
    const size_t limit = std::min(bytes.size(), options.sample_size);
    if (limit == 0) {
        return FileKind::Text;
    }

    size_t suspicious = 0;
    for (size_t i = 0; i < limit; ++i) {
        const auto c = static_cast<unsigned char>(bytes[i]);
        if (c == 0x00) {
            spdlog::debug("NUL byte at offset {}", i);
            return FileKind::Binary;
        }
        if (is_suspicious(c)) {
            ++suspicious;
        }
    }

    const double ratio = static_cast<double>(suspicious) / static_cast<double>(limit);
    spdlog::debug("Suspicious bytes: {}/{} ({:.3f})", suspicious, limit, ratio);
    return ratio > options.binary_threshold ? FileKind::Binary : FileKind::Text;
}

bool contains_crlf(const std::string &bytes) {
    return bytes.find("\r\n") != std::string::npos;
}

bool contains_lone_cr(const std::string &bytes) {
    for (size_t pos = bytes.find('\r'); pos != std::string::npos; pos = bytes.find('\r', pos + 1)) {
        if (pos + 1 == bytes.size() || bytes[pos + 1] != '\n') {
            return true;
        }
    }
    return false;
}

const char *to_string(FileKind kind) {
    switch (kind) {
    case FileKind::Text:
        return "text";
    case FileKind::Binary:
        return "binary";
    }
    return "unknown";
}

} // namespace eolnorm::classify
