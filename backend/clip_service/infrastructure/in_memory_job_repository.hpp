#pragma once
#include "domain/job_repository.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace clip_service {

// Process-lifetime job registry. Jobs are never evicted.
class InMemoryJobRepository : public JobRepository {
public:
  InMemoryJobRepository() = default;

  std::string create(Job job) override;
  std::expected<Job, std::string> findById(const std::string& id) const override;
  bool update(const std::string& id, const Mutator& mutator) override;
  bool remove(const std::string& id) override;
  std::size_t size() const override;

  static std::string generateId(const std::string& prefix);

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Job> jobs_;
};

} // namespace clip_service
