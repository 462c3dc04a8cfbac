#ifndef EOLNORM_WALK_OUTCOME_HPP
#define EOLNORM_WALK_OUTCOME_HPP

#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace eolnorm::walk {

enum class Action {
    Converted,
    SkippedBinary,
    SkippedHidden,
    SkippedExtension,
    NoChange,
    Error
};

inline constexpr size_t kActionCount = 6;

const char *to_string(Action action);

// Result of visiting one entry. Immutable once built.
class FileOutcome {
public:
    static FileOutcome converted(std::filesystem::path path, uint64_t bytes_saved);
    static FileOutcome skipped(std::filesystem::path path, Action action);
    static FileOutcome error(std::filesystem::path path, std::string reason);

    const std::filesystem::path &path() const { return path_; }
    Action action() const { return action_; }
    // Empty unless action() is Action::Error
    const std::string &reason() const { return reason_; }
    uint64_t bytes_saved() const { return bytes_saved_; }

private:
    FileOutcome(std::filesystem::path path, Action action, std::string reason, uint64_t bytes_saved);

    std::filesystem::path path_;
    Action action_;
    std::string reason_;
    uint64_t bytes_saved_;
};

class RunSummary {
public:
    void record(FileOutcome outcome);
    void merge(const RunSummary &other);

    size_t count(Action action) const;
    size_t total() const { return outcomes_.size(); }
    uint64_t bytes_converted() const { return bytes_converted_; }
    const std::vector<FileOutcome> &outcomes() const { return outcomes_; }

private:
    std::array<size_t, kActionCount> counts_{};
    uint64_t bytes_converted_{0};
    std::vector<FileOutcome> outcomes_;
};

} // namespace eolnorm::walk

#endif // EOLNORM_WALK_OUTCOME_HPP
