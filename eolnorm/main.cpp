#include "walk/walker.hpp"
#include "walk/outcome.hpp"
#include "utils/logging.hpp"
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_ostream.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

using namespace llvm;

// Command line options
static cl::OptionCategory EolnormCategory("Eolnorm Options");

static cl::list<std::string> InputPaths(
    cl::Positional,
    cl::desc("[<directory>...]"),
    cl::ZeroOrMore,
    cl::cat(EolnormCategory));

static cl::opt<bool> DryRun(
    "dry-run",
    cl::desc("Report what would be converted without writing any file"),
    cl::init(false),
    cl::cat(EolnormCategory));

static cl::alias DryRunShort(
    "n",
    cl::desc("Alias for --dry-run"),
    cl::aliasopt(DryRun),
    cl::cat(EolnormCategory));

static cl::opt<bool> NoRecursive(
    "no-recursive",
    cl::desc("Do not descend into subdirectories"),
    cl::init(false),
    cl::cat(EolnormCategory));

static cl::opt<bool> SkipHidden(
    "skip-hidden",
    cl::desc("Skip entries whose name starts with '.' (default: on)"),
    cl::init(true),
    cl::cat(EolnormCategory));

static cl::opt<bool> NoSkipHidden(
    "no-skip-hidden",
    cl::desc("Process hidden files and descend into hidden directories"),
    cl::init(false),
    cl::cat(EolnormCategory));

static cl::list<std::string> Extensions(
    "ext",
    cl::desc("Only process files with these extensions (comma separated or repeated).\n"
             "Matching is case-insensitive and the leading dot is optional,\n"
             "so 'rs', '.rs' and 'RS' are equivalent. Only the last extension\n"
             "of a name is compared ('a.tar.gz' has extension 'gz')"),
    cl::value_desc("list"),
    cl::CommaSeparated,
    cl::cat(EolnormCategory));

static cl::opt<bool> ConvertLoneCr(
    "convert-lone-cr",
    cl::desc("Also convert a CR that is not followed by LF"),
    cl::init(false),
    cl::cat(EolnormCategory));

static cl::opt<unsigned> SampleSize(
    "sample-size",
    cl::desc("Bytes inspected when deciding text vs binary (default: 8192)"),
    cl::init(static_cast<unsigned>(eolnorm::classify::ClassifierOptions::kDefaultSampleSize)),
    cl::cat(EolnormCategory));

static cl::opt<double> BinaryThreshold(
    "binary-threshold",
    cl::desc("Ratio of control bytes above which a file is binary (default: 0.30)"),
    cl::init(eolnorm::classify::ClassifierOptions::kDefaultBinaryThreshold),
    cl::cat(EolnormCategory));

static cl::opt<std::string> OutputFormat(
    "format",
    cl::desc("Output format (text, json)"),
    cl::init("text"),
    cl::cat(EolnormCategory));

static cl::opt<bool> Verbose(
    "verbose",
    cl::desc("Enable verbose output"),
    cl::init(false),
    cl::cat(EolnormCategory));

namespace {

constexpr eolnorm::walk::Action kAllActions[] = {
    eolnorm::walk::Action::Converted,
    eolnorm::walk::Action::NoChange,
    eolnorm::walk::Action::SkippedBinary,
    eolnorm::walk::Action::SkippedHidden,
    eolnorm::walk::Action::SkippedExtension,
    eolnorm::walk::Action::Error,
};

std::string json_string(const std::string &text) {
    return json::isUTF8(text) ? text : json::fixUTF8(text);
}

} // namespace

void output_summary_json(const eolnorm::walk::RunSummary& summary) {
    using eolnorm::walk::Action;

    json::OStream J(outs(), 2);
    J.object([&] {
        J.attribute("dry_run", static_cast<bool>(DryRun));
        J.attribute("files", summary.total());
        J.attribute("bytes_converted", summary.bytes_converted());
        J.attributeObject("counts", [&] {
            for (auto action : kAllActions) {
                J.attribute(eolnorm::walk::to_string(action), summary.count(action));
            }
        });
        J.attributeArray("outcomes", [&] {
            for (const auto& outcome : summary.outcomes()) {
                J.object([&] {
                    J.attribute("path", json_string(outcome.path().string()));
                    J.attribute("action", eolnorm::walk::to_string(outcome.action()));
                    if (outcome.action() == Action::Converted) {
                        J.attribute("bytes_saved", outcome.bytes_saved());
                    }
                    if (outcome.action() == Action::Error) {
                        J.attribute("reason", json_string(outcome.reason()));
                    }
                });
            }
        });
    });
    outs() << "\n";
}

void output_summary_text(const eolnorm::walk::RunSummary& summary) {
    using eolnorm::walk::Action;

    for (const auto& outcome : summary.outcomes()) {
        if (outcome.action() == Action::Converted) {
            outs() << (DryRun ? "[dry-run] would convert: " : "converted: ")
                   << outcome.path().string() << "\n";
        } else if (outcome.action() == Action::Error) {
            outs() << "error: " << outcome.path().string() << ": " << outcome.reason() << "\n";
        } else if (Verbose) {
            outs() << eolnorm::walk::to_string(outcome.action()) << ": "
                   << outcome.path().string() << "\n";
        }
    }

    outs() << "\nSummary" << (DryRun ? " (dry run)" : "") << ":\n";
    for (auto action : kAllActions) {
        outs() << "  " << eolnorm::walk::to_string(action) << ": " << summary.count(action) << "\n";
    }
    outs() << "  files: " << summary.total() << "\n"
           << "  bytes " << (DryRun ? "to remove" : "removed") << ": " << summary.bytes_converted() << "\n";
}

int main(int argc, char **argv) {
    InitLLVM X(argc, argv);

    // Parse command line options
    cl::HideUnrelatedOptions(EolnormCategory);
    cl::ParseCommandLineOptions(argc, argv, "eolnorm - convert CRLF line endings to LF\n");

    // Configure spdlog
    eolnorm::utils::init_logging(Verbose);

    if (OutputFormat != "text" && OutputFormat != "json") {
        spdlog::error("Unknown output format: {}", OutputFormat.getValue());
        return 1;
    }
    if (SampleSize == 0) {
        spdlog::error("--sample-size must be greater than zero");
        return 1;
    }
    if (BinaryThreshold < 0.0 || BinaryThreshold > 1.0) {
        spdlog::error("--binary-threshold must be between 0 and 1, got {}", BinaryThreshold.getValue());
        return 1;
    }

    eolnorm::walk::Config base;
    base.recursive = !NoRecursive;
    base.dry_run = DryRun;
    base.skip_hidden = SkipHidden && !NoSkipHidden;
    if (!Extensions.empty()) {
        base.include_extensions = std::set<std::string>(Extensions.begin(), Extensions.end());
    }
    base.lone_cr = ConvertLoneCr ? eolnorm::rewrite::LoneCr::Convert : eolnorm::rewrite::LoneCr::Preserve;
    base.classifier.sample_size = SampleSize;
    base.classifier.binary_threshold = BinaryThreshold;

    std::vector<std::filesystem::path> roots(InputPaths.begin(), InputPaths.end());
    if (roots.empty()) {
        roots.emplace_back(".");
    }

    eolnorm::walk::RunSummary summary;
    try {
        summary = eolnorm::walk::walk_roots(base, roots);
    } catch (const eolnorm::walk::FatalError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("An error occurred: {}", e.what());
        return 1;
    }

    // Output results
    if (OutputFormat == "json") {
        output_summary_json(summary);
    } else {
        output_summary_text(summary);
    }

    return 0;
}
