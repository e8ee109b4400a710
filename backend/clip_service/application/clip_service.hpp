#pragma once

#include <atomic>
#include <expected>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>
#include "common/config/config.hpp"
#include "common/thread_pool.hpp"
#include "domain/job_repository.hpp"
#include "domain/object_store.hpp"
#include "application/job_pipeline.hpp"
#include "infrastructure/history_log.hpp"

namespace clip_service {

struct ParsedSource {
  std::string platform;
  std::string resource_id;
};

struct DownloadRequest {
  std::string url;
  std::string type{"video"};
  std::string quality{"1080p"};
  // informational, derived from url when empty
  std::string platform;
  std::string resource_id;
};

class ClipService {
public:
  ClipService(std::shared_ptr<JobRepository> repository,
              std::shared_ptr<HistoryLog> history,
              std::shared_ptr<JobPipeline> pipeline,
              std::shared_ptr<ObjectStore> store,
              const config::JobsConfig& jobs_config);
  ~ClipService();

  ClipService(const ClipService&) = delete;
  ClipService& operator=(const ClipService&) = delete;

  std::expected<ParsedSource, JobError> parseSource(const std::string& url) const;

  // Registers a queued job and hands it to the worker pool. Never waits for
  // the job itself; with the block policy it may wait for a queue slot.
  std::expected<std::string, JobError> submitDownload(const DownloadRequest& request);

  std::expected<Job, JobError> getJob(const std::string& job_id) const;

  std::vector<HistoryEntry> listHistory() const;

  std::expected<void, JobError> cancelJob(const std::string& job_id);

  // 取消所有任务并等待工作线程退出
  void shutdown();

  static bool isValidSourceUrl(const std::string& url);
  static std::string detectPlatform(const std::string& url);

private:
  void runJob(const std::string& job_id, std::stop_token stop);
  void forget(const std::string& job_id);

  std::shared_ptr<JobRepository> repository_;
  std::shared_ptr<HistoryLog> history_;
  std::shared_ptr<JobPipeline> pipeline_;
  std::shared_ptr<ObjectStore> store_;
  config::JobsConfig jobs_config_;

  std::mutex stops_mutex_;
  std::unordered_map<std::string, std::stop_source> stops_;
  std::atomic_bool stopped_{false};

  // last member: its workers must be joined before the state above goes away
  ThreadPool pool_;
};

} // namespace clip_service
