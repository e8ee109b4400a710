#pragma once
#include "domain/job_context.hpp"
#include "domain/job_repository.hpp"
#include "domain/media_fetcher.hpp"
#include "domain/object_store.hpp"
#include "infrastructure/history_log.hpp"
#include "application/progress_tracker.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>

namespace clip_service {

struct PipelineSettings {
  std::filesystem::path staging_dir;
  std::string key_prefix{"downloads/"};
  std::chrono::seconds url_ttl{900};
};

// Drives one job from queued to done/error: fetch, transfer, URL issuance.
// Each run is the only writer of its job until the job turns terminal.
class JobPipeline {
public:
  JobPipeline(std::shared_ptr<JobRepository> repository,
              std::shared_ptr<HistoryLog> history,
              std::shared_ptr<MediaFetcher> fetcher,
              std::shared_ptr<ObjectStore> store,
              PipelineSettings settings);

  void run(const std::string& job_id, const JobContext& context);

  std::string objectKey(const std::string& job_id, const std::string& extension) const;

private:
  struct Result {
    std::string key;
    std::string url;
    std::uint64_t size;
  };

  std::expected<Result, JobError> execute(const Job& job,
                                          const JobContext& context,
                                          ProgressTracker& tracker,
                                          ErrorKind& stage);

  void finishDone(const std::string& job_id, const Result& result, const JobContext& context);
  void finishError(const std::string& job_id, const JobError& error, const JobContext& context);

  std::shared_ptr<JobRepository> repository_;
  std::shared_ptr<HistoryLog> history_;
  std::shared_ptr<MediaFetcher> fetcher_;
  std::shared_ptr<ObjectStore> store_;
  PipelineSettings settings_;
};

} // namespace clip_service
