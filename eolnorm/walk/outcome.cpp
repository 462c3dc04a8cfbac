#include "outcome.hpp"
#include <utility>

namespace eolnorm::walk {

const char *to_string(Action action) {
    switch (action) {
    case Action::Converted:
        return "converted";
    case Action::SkippedBinary:
        return "skipped_binary";
    case Action::SkippedHidden:
        return "skipped_hidden";
    case Action::SkippedExtension:
        return "skipped_extension";
    case Action::NoChange:
        return "no_change";
    case Action::Error:
        return "error";
    }
    return "unknown";
}

FileOutcome::FileOutcome(std::filesystem::path path, Action action, std::string reason, uint64_t bytes_saved)
    : path_(std::move(path)),
      action_(action),
      reason_(std::move(reason)),
      bytes_saved_(bytes_saved)
{
}

FileOutcome FileOutcome::converted(std::filesystem::path path, uint64_t bytes_saved) {
    return FileOutcome(std::move(path), Action::Converted, "", bytes_saved);
}

FileOutcome FileOutcome::skipped(std::filesystem::path path, Action action) {
    return FileOutcome(std::move(path), action, "", 0);
}

FileOutcome FileOutcome::error(std::filesystem::path path, std::string reason) {
    return FileOutcome(std::move(path), Action::Error, std::move(reason), 0);
}

void RunSummary::record(FileOutcome outcome) {
    ++counts_[static_cast<size_t>(outcome.action())];
    bytes_converted_ += outcome.bytes_saved();
    outcomes_.push_back(std::move(outcome));
}

void RunSummary::merge(const RunSummary &other) {
    for (const auto &outcome : other.outcomes_) {
        record(outcome);
    }
}

size_t RunSummary::count(Action action) const {
    return counts_[static_cast<size_t>(action)];
}

} // namespace eolnorm::walk
