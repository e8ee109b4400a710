#include "history_log.hpp"

namespace clip_service {

HistoryLog::HistoryLog(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void HistoryLog::append(const Job& job) {
  HistoryEntry entry{job, std::chrono::system_clock::now()};

  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_front(std::move(entry));
  while (entries_.size() > capacity_) {
    entries_.pop_back();
  }
}

std::vector<HistoryEntry> HistoryLog::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {entries_.begin(), entries_.end()};
}

std::size_t HistoryLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace clip_service
