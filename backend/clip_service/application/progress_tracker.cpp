#include "progress_tracker.hpp"

#include <algorithm>
#include <cmath>

namespace clip_service {

ProgressTracker::ProgressTracker(std::shared_ptr<JobRepository> repository,
                                 std::string job_id, int initial)
  : repository_(std::move(repository)), job_id_(std::move(job_id)), current_(initial) {}

bool ProgressTracker::advance(int value) {
  value = std::clamp(value, 0, 100);

  std::lock_guard<std::mutex> lock(mutex_);
  if (value <= current_) {
    return false;
  }
  current_ = value;
  repository_->update(job_id_, [value](Job& job) {
    if (!job.terminal() && value > job.progress) {
      job.progress = value;
    }
  });
  return true;
}

bool ProgressTracker::onTransfer(std::uint64_t sent, std::uint64_t total) {
  return advance(transferProgress(sent, total));
}

int ProgressTracker::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

int ProgressTracker::transferProgress(std::uint64_t sent, std::uint64_t total) {
  if (total == 0) {
    return kTransferBase + kTransferSpan;
  }
  auto ratio = static_cast<double>(std::min(sent, total)) / static_cast<double>(total);
  auto step = static_cast<int>(std::lround(kTransferSpan * ratio));
  return kTransferBase + std::min(kTransferSpan, step);
}

} // namespace clip_service
