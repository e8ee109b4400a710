#include "clip_service.hpp"
#include "infrastructure/in_memory_job_repository.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace clip_service {

namespace {

std::string lowered(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

}

ClipService::ClipService(std::shared_ptr<JobRepository> repository,
                         std::shared_ptr<HistoryLog> history,
                         std::shared_ptr<JobPipeline> pipeline,
                         std::shared_ptr<ObjectStore> store,
                         const config::JobsConfig& jobs_config)
  : repository_(std::move(repository)),
    history_(std::move(history)),
    pipeline_(std::move(pipeline)),
    store_(std::move(store)),
    jobs_config_(jobs_config),
    pool_(static_cast<unsigned int>(jobs_config.max_concurrent_jobs), jobs_config.queue_capacity) {}

ClipService::~ClipService() {
  shutdown();
}

bool ClipService::isValidSourceUrl(const std::string& url) {
  auto lower = lowered(url);
  std::size_t host_start;
  if (lower.starts_with("https://")) {
    host_start = 8;
  } else if (lower.starts_with("http://")) {
    host_start = 7;
  } else {
    return false;
  }

  auto host_end = url.find_first_of("/?#", host_start);
  auto host = url.substr(host_start, host_end == std::string::npos ? std::string::npos
                                                                   : host_end - host_start);
  if (host.empty()) {
    return false;
  }
  return std::none_of(url.begin(), url.end(),
                      [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); });
}

std::string ClipService::detectPlatform(const std::string& url) {
  auto lower = lowered(url);
  if (lower.find("tiktok.") != std::string::npos) return "tiktok";
  if (lower.find("instagram.") != std::string::npos) return "instagram";
  if (lower.find("facebook.") != std::string::npos ||
      lower.find("fb.watch") != std::string::npos) return "facebook";
  return "youtube";
}

std::expected<ParsedSource, JobError> ClipService::parseSource(const std::string& url) const {
  if (!isValidSourceUrl(url)) {
    return std::unexpected(JobError{ErrorKind::InvalidInput, "A valid http(s) URL is required"});
  }
  return ParsedSource{detectPlatform(url), InMemoryJobRepository::generateId("rs")};
}

std::expected<std::string, JobError> ClipService::submitDownload(const DownloadRequest& request) {
  if (!isValidSourceUrl(request.url)) {
    return std::unexpected(JobError{ErrorKind::InvalidInput, "A valid http(s) URL is required"});
  }

  auto media_type = parseMediaType(request.type.empty() ? "video" : request.type);
  if (!media_type) {
    return std::unexpected(JobError{ErrorKind::InvalidInput,
                                    "Unsupported type '" + request.type + "' (video or audio)"});
  }

  if (!store_->configured()) {
    return std::unexpected(JobError{ErrorKind::Configuration,
                                    "Object storage bucket is not configured (S3_BUCKET)"});
  }

  if (stopped_.load()) {
    return std::unexpected(JobError{ErrorKind::QueueFull, "Service is shutting down"});
  }

  Job job;
  job.status = JobStatus::Queued;
  job.progress = 0;
  job.media_type = *media_type;
  job.quality = request.quality.empty() ? "1080p" : request.quality;
  job.source_url = request.url;
  job.platform = request.platform.empty() ? detectPlatform(request.url) : request.platform;
  job.resource_id = request.resource_id.empty() ? InMemoryJobRepository::generateId("rs")
                                                : request.resource_id;

  auto job_id = repository_->create(std::move(job));
  std::stop_source stop;
  {
    std::lock_guard<std::mutex> lock(stops_mutex_);
    stops_.emplace(job_id, stop);
  }

  auto task = [this, job_id, token = stop.get_token()]() { runJob(job_id, token); };

  bool accepted = false;
  try {
    if (jobs_config_.queue_full_policy == config::QueueFullPolicy::Block) {
      pool_.commit(task);
      accepted = true;
    } else {
      accepted = pool_.tryCommit(task).has_value();
    }
  } catch (const std::runtime_error& e) {
    std::cerr << "[service] cannot queue " << job_id << ": " << e.what() << std::endl;
  }

  if (!accepted) {
    forget(job_id);
    repository_->remove(job_id);
    return std::unexpected(JobError{ErrorKind::QueueFull,
                                    stopped_.load() ? "Service is shutting down"
                                                    : "Too many pending jobs, try again later"});
  }

  std::cout << "[service] queued " << job_id << " for " << request.url << std::endl;
  return job_id;
}

std::expected<Job, JobError> ClipService::getJob(const std::string& job_id) const {
  auto job = repository_->findById(job_id);
  if (!job) {
    return std::unexpected(JobError{ErrorKind::NotFound, "job not found"});
  }
  return *job;
}

std::vector<HistoryEntry> ClipService::listHistory() const {
  return history_->snapshot();
}

std::expected<void, JobError> ClipService::cancelJob(const std::string& job_id) {
  auto job = repository_->findById(job_id);
  if (!job) {
    return std::unexpected(JobError{ErrorKind::NotFound, "job not found"});
  }
  if (job->terminal()) {
    return std::unexpected(JobError{ErrorKind::InvalidInput,
                                    "Job already finished with status " +
                                      std::string(toString(job->status))});
  }

  {
    std::lock_guard<std::mutex> lock(stops_mutex_);
    auto it = stops_.find(job_id);
    if (it == stops_.end()) {
      return std::unexpected(JobError{ErrorKind::InvalidInput, "Job already finished"});
    }
    it->second.request_stop();
  }

  // the pipeline may have recorded its outcome before the stop landed
  auto after = repository_->findById(job_id);
  if (after && after->terminal() && after->error_kind != ErrorKind::Cancelled) {
    return std::unexpected(JobError{ErrorKind::InvalidInput,
                                    "Job already finished with status " +
                                      std::string(toString(after->status))});
  }
  std::cout << "[service] cancellation requested for " << job_id << std::endl;
  return {};
}

void ClipService::shutdown() {
  if (stopped_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(stops_mutex_);
    for (auto& [id, stop] : stops_) {
      stop.request_stop();
    }
  }
  pool_.shutdown();
}

void ClipService::runJob(const std::string& job_id, std::stop_token stop) {
  std::optional<JobContext::Clock::time_point> deadline;
  if (jobs_config_.job_timeout.count() > 0) {
    deadline = JobContext::Clock::now() + jobs_config_.job_timeout;
  }

  try {
    pipeline_->run(job_id, JobContext(std::move(stop), deadline));
  } catch (const std::exception& e) {
    std::cerr << "[service] pipeline for " << job_id << " threw: " << e.what() << std::endl;
  }
  forget(job_id);
}

void ClipService::forget(const std::string& job_id) {
  std::lock_guard<std::mutex> lock(stops_mutex_);
  stops_.erase(job_id);
}

} // namespace clip_service
