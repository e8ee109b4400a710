#include "in_memory_job_repository.hpp"

#include <mutex>
#include <uuid/uuid.h>

namespace clip_service {

std::string InMemoryJobRepository::generateId(const std::string& prefix) {
  uuid_t uuid;
  uuid_generate_random(uuid);

  static constexpr char kHex[] = "0123456789abcdef";
  std::string id = prefix + "_";
  id.reserve(prefix.size() + 1 + sizeof(uuid) * 2);
  for (auto byte : uuid) {
    id.push_back(kHex[byte >> 4]);
    id.push_back(kHex[byte & 0x0f]);
  }
  return id;
}

std::string InMemoryJobRepository::create(Job job) {
  auto now = std::chrono::system_clock::now();
  job.created_at = now;
  job.updated_at = now;

  std::unique_lock lock(mutex_);
  do {
    job.id = generateId("job");
  } while (jobs_.contains(job.id));

  auto id = job.id;
  jobs_.emplace(id, std::move(job));
  return id;
}

std::expected<Job, std::string> InMemoryJobRepository::findById(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return std::unexpected("Job not found: " + id);
  }
  return it->second;
}

bool InMemoryJobRepository::update(const std::string& id, const Mutator& mutator) {
  std::unique_lock lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return false;
  }

  // mutate a copy so a throwing mutator leaves the stored job untouched
  Job updated = it->second;
  updated.updated_at = std::chrono::system_clock::now();
  mutator(updated);
  updated.id = id;
  it->second = std::move(updated);
  return true;
}

bool InMemoryJobRepository::remove(const std::string& id) {
  std::unique_lock lock(mutex_);
  return jobs_.erase(id) > 0;
}

std::size_t InMemoryJobRepository::size() const {
  std::shared_lock lock(mutex_);
  return jobs_.size();
}

} // namespace clip_service
