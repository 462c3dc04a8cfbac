#include "walk/outcome.hpp"
#include <gtest/gtest.h>
#include <string>

using eolnorm::walk::Action;
using eolnorm::walk::FileOutcome;
using eolnorm::walk::RunSummary;

TEST(OutcomeTest, ErrorCarriesReason) {
    auto outcome = FileOutcome::error("a.txt", "Permission denied");
    EXPECT_EQ(outcome.action(), Action::Error);
    EXPECT_EQ(outcome.reason(), "Permission denied");
    EXPECT_EQ(outcome.bytes_saved(), 0u);
}

TEST(OutcomeTest, SummaryCountsEachAction) {
    RunSummary summary;
    summary.record(FileOutcome::converted("a.txt", 3));
    summary.record(FileOutcome::converted("b.txt", 4));
    summary.record(FileOutcome::skipped("c.bin", Action::SkippedBinary));
    summary.record(FileOutcome::skipped(".git", Action::SkippedHidden));
    summary.record(FileOutcome::error("d.txt", "boom"));

    EXPECT_EQ(summary.total(), 5u);
    EXPECT_EQ(summary.count(Action::Converted), 2u);
    EXPECT_EQ(summary.count(Action::SkippedBinary), 1u);
    EXPECT_EQ(summary.count(Action::SkippedHidden), 1u);
    EXPECT_EQ(summary.count(Action::SkippedExtension), 0u);
    EXPECT_EQ(summary.count(Action::NoChange), 0u);
    EXPECT_EQ(summary.count(Action::Error), 1u);
    EXPECT_EQ(summary.bytes_converted(), 7u);
    EXPECT_EQ(summary.outcomes()[2].path().string(), "c.bin");
}

TEST(OutcomeTest, MergeAppendsInOrder) {
    RunSummary first;
    first.record(FileOutcome::converted("a.txt", 2));

    RunSummary second;
    second.record(FileOutcome::skipped("b.txt", Action::NoChange));
    second.record(FileOutcome::converted("c.txt", 5));

    first.merge(second);
    ASSERT_EQ(first.total(), 3u);
    EXPECT_EQ(first.count(Action::Converted), 2u);
    EXPECT_EQ(first.count(Action::NoChange), 1u);
    EXPECT_EQ(first.bytes_converted(), 7u);
    EXPECT_EQ(first.outcomes()[1].path().string(), "b.txt");
}

TEST(OutcomeTest, ActionNames) {
    EXPECT_STREQ(eolnorm::walk::to_string(Action::Converted), "converted");
    EXPECT_STREQ(eolnorm::walk::to_string(Action::SkippedExtension), "skipped_extension");
    EXPECT_STREQ(eolnorm::walk::to_string(Action::Error), "error");
}
