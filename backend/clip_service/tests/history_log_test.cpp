#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "infrastructure/history_log.hpp"

namespace {

using clip_service::HistoryLog;
using clip_service::Job;
using clip_service::JobStatus;

Job terminalJob(const std::string& id) {
  Job job;
  job.id = id;
  job.status = JobStatus::Done;
  job.progress = 100;
  return job;
}

TEST(HistoryLog, NewestFirst) {
  HistoryLog history;
  history.append(terminalJob("a"));
  history.append(terminalJob("b"));
  history.append(terminalJob("c"));

  auto entries = history.snapshot();
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].job.id, "c");
  EXPECT_EQ(entries[1].job.id, "b");
  EXPECT_EQ(entries[2].job.id, "a");
  EXPECT_GE(entries[0].captured_at, entries[2].captured_at);
}

TEST(HistoryLog, EvictsOldestPastCapacity) {
  HistoryLog history;
  EXPECT_EQ(history.capacity(), 50u);
  for (int i = 0; i < 60; ++i) {
    history.append(terminalJob("job" + std::to_string(i)));
  }

  auto entries = history.snapshot();
  ASSERT_EQ(entries.size(), 50u);
  EXPECT_EQ(entries.front().job.id, "job59");
  EXPECT_EQ(entries.back().job.id, "job10");
}

TEST(HistoryLog, SnapshotIsDetachedCopy) {
  HistoryLog history(2);
  history.append(terminalJob("a"));
  auto before = history.snapshot();
  history.append(terminalJob("b"));
  EXPECT_EQ(before.size(), 1u);
  EXPECT_EQ(history.size(), 2u);
}

TEST(HistoryLog, ConcurrentAppendsRespectCapacity) {
  HistoryLog history(50);
  std::vector<std::thread> writers;
  for (int w = 0; w < 8; ++w) {
    writers.emplace_back([&history, w]() {
      for (int i = 0; i < 100; ++i) {
        history.append(terminalJob(std::to_string(w) + "-" + std::to_string(i)));
        EXPECT_LE(history.size(), 50u);
      }
    });
  }
  for (auto& t : writers) {
    t.join();
  }
  EXPECT_EQ(history.size(), 50u);
}

} // namespace
