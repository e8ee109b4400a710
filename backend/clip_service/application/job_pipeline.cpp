#include "job_pipeline.hpp"
#include "application/format_resolver.hpp"
#include "infrastructure/staged_artifact.hpp"

#include <iostream>
#include <system_error>

namespace clip_service {

namespace {

// progress checkpoints
constexpr int kStarted = 5;
constexpr int kFormatResolved = 10;
constexpr int kToolStarted = 15;
constexpr int kFetched = 60;
constexpr int kTransferred = 90;

void recordError(Job& job, const JobError& error) {
  job.status = JobStatus::Error;
  job.progress = 0;
  job.error_message = error.message;
  job.error_kind = error.kind;
  job.result_key.reset();
  job.result_url.reset();
  job.file_size.reset();
}

}

JobPipeline::JobPipeline(std::shared_ptr<JobRepository> repository,
                         std::shared_ptr<HistoryLog> history,
                         std::shared_ptr<MediaFetcher> fetcher,
                         std::shared_ptr<ObjectStore> store,
                         PipelineSettings settings)
  : repository_(std::move(repository)),
    history_(std::move(history)),
    fetcher_(std::move(fetcher)),
    store_(std::move(store)),
    settings_(std::move(settings)) {}

std::string JobPipeline::objectKey(const std::string& job_id, const std::string& extension) const {
  return settings_.key_prefix + job_id + "." + extension;
}

void JobPipeline::run(const std::string& job_id, const JobContext& context) {
  auto job = repository_->findById(job_id);
  if (!job) {
    std::cerr << "[pipeline] " << job_id << " is no longer registered, run aborted" << std::endl;
    return;
  }
  if (job->terminal()) {
    std::cerr << "[pipeline] " << job_id << " is already " << toString(job->status)
              << ", run aborted" << std::endl;
    return;
  }

  if (!store_->configured()) {
    finishError(job_id, JobError{ErrorKind::Configuration,
                                 "Object storage bucket is not configured (S3_BUCKET)"}, context);
    return;
  }

  if (!repository_->update(job_id, [](Job& j) { j.status = JobStatus::Processing; })) {
    std::cerr << "[pipeline] " << job_id << " is no longer registered, run aborted" << std::endl;
    return;
  }
  ProgressTracker tracker(repository_, job_id, job->progress);
  tracker.advance(kStarted);
  std::cout << "[pipeline] " << job_id << " processing " << job->source_url
            << " (" << toString(job->media_type) << ", " << job->quality << ")" << std::endl;

  ErrorKind stage = ErrorKind::Fetch;
  std::expected<Result, JobError> result;
  try {
    result = execute(*job, context, tracker, stage);
  } catch (const std::exception& e) {
    result = std::unexpected(JobError{stage, std::string("Unexpected failure: ") + e.what()});
  }

  if (result) {
    finishDone(job_id, *result, context);
  } else {
    finishError(job_id, result.error(), context);
  }
}

std::expected<JobPipeline::Result, JobError> JobPipeline::execute(
    const Job& job,
    const JobContext& context,
    ProgressTracker& tracker,
    ErrorKind& stage) {

  stage = ErrorKind::Fetch;
  if (context.cancelled()) {
    return std::unexpected(context.interruption());
  }

  auto format = resolveFormat(job.media_type, job.quality);
  tracker.advance(kFormatResolved);

  std::error_code ec;
  std::filesystem::create_directories(settings_.staging_dir, ec);
  if (ec) {
    return std::unexpected(JobError{ErrorKind::Fetch, "Cannot create staging directory " +
                                    settings_.staging_dir.string() + ": " + ec.message()});
  }

  // removes the download and yt-dlp side files on every path out of here
  StagedArtifact artifact(settings_.staging_dir, job.id, format.extension);

  auto fetched = fetcher_->fetch(job.source_url, format, artifact.path(), context,
                                 [&tracker]() { tracker.advance(kToolStarted); });
  if (!fetched) {
    return std::unexpected(fetched.error());
  }

  stage = ErrorKind::EmptyArtifact;
  auto size = artifact.size();
  if (!size || *size == 0) {
    return std::unexpected(JobError{ErrorKind::EmptyArtifact,
                                    "Download produced an empty file (no media data retrieved)"});
  }
  tracker.advance(kFetched);

  stage = ErrorKind::Transfer;
  if (context.cancelled()) {
    return std::unexpected(context.interruption());
  }
  auto key = objectKey(job.id, format.extension);
  auto sent = store_->putObject(key, artifact.path(), format.content_type, context,
                                [&tracker](std::uint64_t bytes, std::uint64_t total) {
                                  tracker.onTransfer(bytes, total);
                                });
  if (!sent) {
    return std::unexpected(sent.error());
  }
  if (*sent != *size) {
    return std::unexpected(JobError{
      ErrorKind::Transfer,
      "Uploaded " + std::to_string(*sent) + " bytes but artifact has " + std::to_string(*size)});
  }
  tracker.advance(kTransferred);

  stage = ErrorKind::Issuance;
  if (context.cancelled()) {
    return std::unexpected(context.interruption());
  }
  auto url = store_->presignGetUrl(key, settings_.url_ttl);
  if (!url) {
    return std::unexpected(url.error());
  }

  return Result{key, *url, *size};
}

// A stop requested before the terminal write turns the outcome into Cancelled.
// The history entry is appended under the same registry write, so a job seen
// terminal always has its entry.
void JobPipeline::finishDone(const std::string& job_id, const Result& result,
                             const JobContext& context) {
  bool cancelled = false;
  bool found = repository_->update(job_id, [&](Job& job) {
    cancelled = context.stopRequested();
    if (cancelled) {
      recordError(job, context.interruption());
    } else {
      job.status = JobStatus::Done;
      job.progress = 100;
      job.result_key = result.key;
      job.result_url = result.url;
      job.file_size = result.size;
      job.error_message.reset();
      job.error_kind.reset();
    }
    history_->append(job);
  });
  if (!found) {
    std::cerr << "[pipeline] " << job_id << " vanished before completion was recorded" << std::endl;
  } else if (cancelled) {
    std::cerr << "[pipeline] " << job_id << " cancelled after upload of " << result.key
              << std::endl;
  } else {
    std::cout << "[pipeline] " << job_id << " done: " << result.key
              << " (" << result.size << " bytes)" << std::endl;
  }
}

void JobPipeline::finishError(const std::string& job_id, const JobError& error,
                              const JobContext& context) {
  auto outcome = context.stopRequested() ? context.interruption() : error;
  bool found = repository_->update(job_id, [&](Job& job) {
    recordError(job, outcome);
    history_->append(job);
  });
  if (!found) {
    std::cerr << "[pipeline] " << job_id << " vanished before its failure was recorded" << std::endl;
  }
  std::cerr << "[pipeline] " << job_id << " failed (" << toString(outcome.kind) << "): "
            << outcome.message << std::endl;
}

} // namespace clip_service
