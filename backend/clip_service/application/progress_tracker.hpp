#pragma once
#include "domain/job_repository.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace clip_service {

// Sole writer of a job's progress while it is running. Values that would move
// progress backwards are dropped, so concurrent transfer callbacks may report
// out of order.
class ProgressTracker {
public:
  static constexpr int kTransferBase = 60;
  static constexpr int kTransferSpan = 30;

  ProgressTracker(std::shared_ptr<JobRepository> repository, std::string job_id, int initial = 0);

  // Returns true if the stored progress changed.
  bool advance(int value);

  // Maps transfer bytes into the 60..90 band.
  bool onTransfer(std::uint64_t sent, std::uint64_t total);

  int current() const;

  static int transferProgress(std::uint64_t sent, std::uint64_t total);

private:
  std::shared_ptr<JobRepository> repository_;
  std::string job_id_;
  mutable std::mutex mutex_;
  int current_;
};

} // namespace clip_service
