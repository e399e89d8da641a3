#include "infra/progress_reporter.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <memory>

using easythreads::infra::ProgressReporter;
using easythreads::testing::RecordingLogger;

TEST(ProgressReporterTest, RendersBar) {
  ProgressReporter reporter(nullptr, 10);
  EXPECT_EQ(reporter.render_bar(0, 4), "[..........]");
  EXPECT_EQ(reporter.render_bar(2, 4), "[#####.....]");
  EXPECT_EQ(reporter.render_bar(9, 4), "[##########]");
}

TEST(ProgressReporterTest, LogsOnlyWhenPercentChanges) {
  auto logger = std::make_shared<RecordingLogger>();
  ProgressReporter reporter(logger, 10);
  auto observer = reporter.observer();

  EXPECT_EQ(reporter.last_percent("job"), -1);
  observer("job", 0, 4);
  observer("job", 2, 4);
  observer("job", 2, 4);
  observer("job", 4, 4);
  observer("job", 4, 4);

  EXPECT_EQ(reporter.last_percent("job"), 100);
  EXPECT_EQ(logger->count_event("progress"), 3);

  const auto entries = logger->entries();
  ASSERT_FALSE(entries.empty());
  EXPECT_EQ(entries.back().task, "job");
  EXPECT_EQ(entries.back().msg, "[##########] 100% (4/4)");
}

TEST(ProgressReporterTest, TracksTasksIndependently) {
  ProgressReporter reporter(nullptr);
  reporter.report("a", 1, 2);
  reporter.report("b", 1, 4);
  EXPECT_EQ(reporter.last_percent("a"), 50);
  EXPECT_EQ(reporter.last_percent("b"), 25);
}

TEST(ProgressReporterTest, LargeTotalsDoNotOverflow) {
  ProgressReporter reporter(nullptr, 10);
  reporter.report("big", 1'000'000'000, 2'000'000'000);
  EXPECT_EQ(reporter.last_percent("big"), 50);
  EXPECT_EQ(reporter.render_bar(1'000'000'000, 2'000'000'000), "[#####.....]");
  EXPECT_EQ(reporter.render_bar(2'000'000'000, 2'000'000'000), "[##########]");
}
