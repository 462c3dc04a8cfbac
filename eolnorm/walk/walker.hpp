#ifndef EOLNORM_WALK_WALKER_HPP
#define EOLNORM_WALK_WALKER_HPP

#pragma once

#include "classify/classifier.hpp"
#include "rewrite/rewriter.hpp"
#include "walk/outcome.hpp"
#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace eolnorm::walk {

struct Config {
    std::filesystem::path root{"."};
    bool recursive{true};
    bool dry_run{false};
    bool skip_hidden{true};
    // When set, only files whose extension is listed are considered
    std::optional<std::set<std::string>> include_extensions;
    rewrite::LoneCr lone_cr{rewrite::LoneCr::Preserve};
    classify::ClassifierOptions classifier;
};

// Raised when the walk cannot start at all (missing or unreadable root)
class FatalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Walker {
public:
    explicit Walker(Config config);
    virtual ~Walker() = default;

    // Throws FatalError unless config().root is a readable directory
    void check_root() const;

    // Visits the tree under config().root depth-first in file name order.
    // Per-entry failures end up in the summary; only root problems throw FatalError.
    RunSummary walk() const;

    const Config &config() const { return config_; }

protected:
    // Writes the converted content over file_path; throws std::runtime_error on failure
    virtual void replace_file(const std::filesystem::path &file_path, const std::string &content) const;

private:
    void visit_directory(const std::filesystem::path &directory_path, RunSummary &summary) const;
    void visit_entry(const std::filesystem::directory_entry &entry, RunSummary &summary) const;
    FileOutcome process_file(const std::filesystem::path &file_path) const;

    Config config_;
};

// Walks every root with the same settings. All roots are checked before any
// file is touched, so a bad root aborts the run without partial rewrites.
RunSummary walk_roots(const Config &base, const std::vector<std::filesystem::path> &roots);

} // namespace eolnorm::walk

#endif // EOLNORM_WALK_WALKER_HPP
