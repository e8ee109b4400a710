#pragma once
#include "domain/job_context.hpp"
#include "domain/job_error.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>

namespace clip_service {

class ObjectStore {
public:
  using TransferProgress = std::function<void(std::uint64_t sent, std::uint64_t total)>;

  virtual ~ObjectStore() = default;

  // False when no destination bucket is configured.
  virtual bool configured() const = 0;

  // Uploads file under key; returns the number of bytes the store accepted.
  virtual std::expected<std::uint64_t, JobError> putObject(
    const std::string& key,
    const std::filesystem::path& file,
    const std::string& content_type,
    const JobContext& context,
    TransferProgress progress = nullptr
  ) = 0;

  virtual std::expected<std::string, JobError> presignGetUrl(
    const std::string& key,
    std::chrono::seconds ttl
  ) = 0;
};

} // namespace clip_service
