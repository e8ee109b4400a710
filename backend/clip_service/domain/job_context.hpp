#pragma once
#include "domain/job_error.hpp"

#include <chrono>
#include <optional>
#include <stop_token>
#include <utility>

namespace clip_service {

// Cancellation token plus optional deadline, observed by every stage.
class JobContext {
public:
  using Clock = std::chrono::steady_clock;

  JobContext() = default;
  JobContext(std::stop_token stop, std::optional<Clock::time_point> deadline)
    : stop_(std::move(stop)), deadline_(deadline) {}

  bool stopRequested() const { return stop_.stop_requested(); }
  bool expired() const { return deadline_ && Clock::now() >= *deadline_; }
  bool cancelled() const { return stopRequested() || expired(); }

  JobError interruption() const {
    if (stopRequested()) {
      return {ErrorKind::Cancelled, "Job was cancelled"};
    }
    return {ErrorKind::Timeout, "Job exceeded its time limit"};
  }

  const std::stop_token& token() const { return stop_; }

private:
  std::stop_token stop_;
  std::optional<Clock::time_point> deadline_;
};

} // namespace clip_service
