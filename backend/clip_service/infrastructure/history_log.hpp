#pragma once
#include "domain/job.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace clip_service {

// Newest-first record of terminal job outcomes with a fixed capacity.
class HistoryLog {
public:
  static constexpr std::size_t kDefaultCapacity = 50;

  explicit HistoryLog(std::size_t capacity = kDefaultCapacity);

  void append(const Job& job);
  std::vector<HistoryEntry> snapshot() const;
  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }

private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<HistoryEntry> entries_;
};

} // namespace clip_service
