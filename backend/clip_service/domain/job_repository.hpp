#pragma once

// project
#include "job.hpp"

// std
#include <cstddef>
#include <expected>
#include <functional>
#include <string>

namespace clip_service {

class JobRepository {
public:
  using Mutator = std::function<void(Job&)>;

  virtual ~JobRepository() = default;
  // Stores the job under a freshly generated id and returns that id.
  virtual std::string create(Job job) = 0;
  virtual std::expected<Job, std::string> findById(const std::string& id) const = 0;
  // Applies mutator atomically with respect to readers. False if id is unknown.
  virtual bool update(const std::string& id, const Mutator& mutator) = 0;
  virtual bool remove(const std::string& id) = 0;
  virtual std::size_t size() const = 0;
};

} // namespace clip_service
