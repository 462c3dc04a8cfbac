#include "walker.hpp"
#include "utils/filesystem.hpp"
#include <spdlog/spdlog.h>
#include <system_error>
#include <utility>

namespace eolnorm::walk {

namespace fs = std::filesystem;

Walker::Walker(Config config)
    : config_(std::move(config))
{
    if (config_.include_extensions) {
        config_.include_extensions = utils::normalize_extensions(
            std::vector<std::string>(config_.include_extensions->begin(), config_.include_extensions->end()));
    }
}

void Walker::check_root() const {
    const fs::path &root = config_.root;

    std::error_code ec;
    const auto root_status = fs::status(root, ec);
    if (ec || !fs::exists(root_status)) {
        throw FatalError("Root path does not exist: " + root.string());
    }
    if (!fs::is_directory(root_status)) {
        throw FatalError("Root path is not a directory: " + root.string());
    }

    fs::directory_iterator first(root, ec);
    if (ec) {
        throw FatalError("Failed to read root directory " + root.string() + ": " + ec.message());
    }
}

RunSummary Walker::walk() const {
    const fs::path &root = config_.root;
    check_root();

    std::vector<fs::directory_entry> entries;
    try {
        entries = utils::list_entries(root);
    } catch (const fs::filesystem_error &e) {
        throw FatalError("Failed to read root directory " + root.string() + ": " + e.code().message());
    }

    spdlog::info("Walking {} (recursive: {}, dry run: {})",
        root.string(), config_.recursive ? "yes" : "no", config_.dry_run ? "yes" : "no");

    RunSummary summary;
    for (const auto &entry : entries) {
        visit_entry(entry, summary);
    }

    spdlog::info("Finished {}: {} files, {} converted, {} errors",
        root.string(), summary.total(), summary.count(Action::Converted), summary.count(Action::Error));
    return summary;
}

void Walker::visit_directory(const fs::path &dir_path, RunSummary &summary) const {
    std::vector<fs::directory_entry> entries;
    try {
        entries = utils::list_entries(dir_path);
    } catch (const fs::filesystem_error &e) {
        spdlog::error("Failed to read directory {}: {}", dir_path.string(), e.code().message());
        summary.record(FileOutcome::error(dir_path, e.code().message()));
        return;
    }

    for (const auto &entry : entries) {
        visit_entry(entry, summary);
    }
}

void Walker::visit_entry(const fs::directory_entry &entry, RunSummary &summary) const {
    const fs::path &path = entry.path();

    if (config_.skip_hidden && utils::is_hidden(path)) {
        spdlog::debug("Skipping hidden entry: {}", path.string());
        summary.record(FileOutcome::skipped(path, Action::SkippedHidden));
        return;
    }

    std::error_code ec;
    const auto status = entry.symlink_status(ec);
    if (ec) {
        spdlog::error("Failed to stat {}: {}", path.string(), ec.message());
        summary.record(FileOutcome::error(path, ec.message()));
        return;
    }

    if (fs::is_symlink(status)) {
        spdlog::debug("Not following symlink: {}", path.string());
        return;
    }

    if (fs::is_directory(status)) {
        if (!config_.recursive) {
            spdlog::debug("Not descending into {}", path.string());
            return;
        }
        visit_directory(path, summary);
        return;
    }

    if (!fs::is_regular_file(status)) {
        spdlog::debug("Ignoring special file: {}", path.string());
        return;
    }

    summary.record(process_file(path));
}

FileOutcome Walker::process_file(const fs::path &file_path) const {
    if (config_.include_extensions &&
        !utils::has_listed_extension(file_path, *config_.include_extensions)) {
        spdlog::debug("Extension not listed: {}", file_path.string());
        return FileOutcome::skipped(file_path, Action::SkippedExtension);
    }

    std::string content;
    try {
        content = utils::read_file_bytes(file_path);
    } catch (const std::runtime_error &e) {
        spdlog::error("{}", e.what());
        return FileOutcome::error(file_path, e.what());
    }

    auto kind = classify::classify(content, config_.classifier);
    spdlog::debug("Classified {} as {}", file_path.string(), classify::to_string(kind));
    if (kind == classify::FileKind::Binary) {
        return FileOutcome::skipped(file_path, Action::SkippedBinary);
    }
    // The classifier only samples the head; a NUL anywhere rules out a rewrite
    if (content.find('\0') != std::string::npos) {
        spdlog::debug("NUL byte past the sample in {}", file_path.string());
        return FileOutcome::skipped(file_path, Action::SkippedBinary);
    }

    if (!rewrite::needs_conversion(content, config_.lone_cr)) {
        return FileOutcome::skipped(file_path, Action::NoChange);
    }

    std::string converted = rewrite::rewrite(content, config_.lone_cr);
    const uint64_t bytes_saved = content.size() - converted.size();

    if (config_.dry_run) {
        spdlog::info("[dry-run] Would convert {} ({} bytes saved)", file_path.string(), bytes_saved);
        return FileOutcome::converted(file_path, bytes_saved);
    }

    try {
        replace_file(file_path, converted);
    } catch (const std::runtime_error &e) {
        spdlog::error("{}", e.what());
        return FileOutcome::error(file_path, e.what());
    }

    spdlog::info("Converted {} ({} bytes saved)", file_path.string(), bytes_saved);
    return FileOutcome::converted(file_path, bytes_saved);
}

void Walker::replace_file(const fs::path &file_path, const std::string &content) const {
    rewrite::replace_file_atomically(file_path, content);
}

RunSummary walk_roots(const Config &base, const std::vector<fs::path> &roots) {
    std::vector<Walker> walkers;
    walkers.reserve(roots.size());
    for (const auto &root : roots) {
        Config config = base;
        config.root = root;
        walkers.emplace_back(std::move(config));
        walkers.back().check_root();
    }

    RunSummary summary;
    for (const auto &walker : walkers) {
        summary.merge(walker.walk());
    }
    return summary;
}

} // namespace eolnorm::walk
