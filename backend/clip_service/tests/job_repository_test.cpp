#include <atomic>
#include <regex>
#include <set>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "infrastructure/in_memory_job_repository.hpp"

namespace {

using clip_service::InMemoryJobRepository;
using clip_service::Job;
using clip_service::JobStatus;

TEST(InMemoryJobRepository, CreateAssignsUniqueOpaqueIds) {
  InMemoryJobRepository repository;
  std::set<std::string> ids;
  const std::regex pattern("job_[0-9a-f]{32}");
  for (int i = 0; i < 100; ++i) {
    auto id = repository.create(Job{});
    EXPECT_TRUE(std::regex_match(id, pattern)) << id;
    ids.insert(id);
  }
  EXPECT_EQ(ids.size(), 100u);
  EXPECT_EQ(repository.size(), 100u);
}

TEST(InMemoryJobRepository, FindByIdReturnsSnapshot) {
  InMemoryJobRepository repository;
  Job job;
  job.source_url = "https://youtu.be/abc123";
  job.quality = "720p";
  auto id = repository.create(job);

  auto found = repository.findById(id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->id, id);
  EXPECT_EQ(found->status, JobStatus::Queued);
  EXPECT_EQ(found->source_url, "https://youtu.be/abc123");
  EXPECT_EQ(found->created_at, found->updated_at);
}

TEST(InMemoryJobRepository, UnknownIdIsNotFound) {
  InMemoryJobRepository repository;
  EXPECT_FALSE(repository.findById("job_missing").has_value());
  EXPECT_FALSE(repository.update("job_missing", [](Job&) {}));
  EXPECT_FALSE(repository.remove("job_missing"));
}

TEST(InMemoryJobRepository, UpdateAppliesMutatorAndKeepsId) {
  InMemoryJobRepository repository;
  auto id = repository.create(Job{});

  EXPECT_TRUE(repository.update(id, [](Job& job) {
    job.id = "tampered";
    job.status = JobStatus::Processing;
    job.progress = 15;
  }));

  auto found = repository.findById(id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->id, id);
  EXPECT_EQ(found->status, JobStatus::Processing);
  EXPECT_EQ(found->progress, 15);
  EXPECT_FALSE(repository.findById("tampered").has_value());
}

TEST(InMemoryJobRepository, ThrowingMutatorLeavesJobUntouched) {
  InMemoryJobRepository repository;
  auto id = repository.create(Job{});

  EXPECT_THROW(repository.update(id, [](Job& job) {
    job.progress = 50;
    throw std::runtime_error("boom");
  }), std::runtime_error);

  EXPECT_EQ(repository.findById(id)->progress, 0);
}

TEST(InMemoryJobRepository, RemoveForgetsJob) {
  InMemoryJobRepository repository;
  auto id = repository.create(Job{});
  EXPECT_TRUE(repository.remove(id));
  EXPECT_FALSE(repository.findById(id).has_value());
  EXPECT_EQ(repository.size(), 0u);
}

TEST(InMemoryJobRepository, ReadersNeverSeeProgressGoBackwards) {
  InMemoryJobRepository repository;
  auto id = repository.create(Job{});
  std::atomic_bool done{false};
  std::atomic_bool regressed{false};

  std::vector<std::thread> readers;
  for (int i = 0; i < 4; ++i) {
    readers.emplace_back([&]() {
      int last = 0;
      while (!done.load()) {
        auto job = repository.findById(id);
        if (job->progress < last) {
          regressed = true;
        }
        last = job->progress;
      }
    });
  }

  for (int p = 1; p <= 100; ++p) {
    repository.update(id, [p](Job& job) { job.progress = p; });
  }
  done = true;
  for (auto& t : readers) {
    t.join();
  }

  EXPECT_FALSE(regressed.load());
  EXPECT_EQ(repository.findById(id)->progress, 100);
}

} // namespace
