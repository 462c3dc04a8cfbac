#ifndef EOLNORM_CLASSIFY_CLASSIFIER_HPP
#define EOLNORM_CLASSIFY_CLASSIFIER_HPP

#pragma once

#include <cstddef>
#include <string>

namespace eolnorm::classify {

enum class FileKind {
    Text,
    Binary
};

struct ClassifierOptions {
    static constexpr size_t kDefaultSampleSize = 8192;
    static constexpr double kDefaultBinaryThreshold = 0.30;

    // Number of leading bytes inspected
    size_t sample_size{kDefaultSampleSize};
    // Suspicious-byte ratio above which a sample is binary
    double binary_threshold{kDefaultBinaryThreshold};
};

// Decides from the leading bytes whether content is safe to treat as text.
// A NUL byte always means binary. Bytes >= 0x80 count as text so UTF-8 passes.
FileKind classify(const std::string &bytes, const ClassifierOptions &options = {});

bool contains_crlf(const std::string &bytes);

// A CR that is not immediately followed by LF (old Mac style)
bool contains_lone_cr(const std::string &bytes);

const char *to_string(FileKind kind);

} // namespace eolnorm::classify

#endif // EOLNORM_CLASSIFY_CLASSIFIER_HPP
