#pragma once
#include "domain/job_context.hpp"
#include "domain/job_error.hpp"

#include <expected>
#include <filesystem>
#include <functional>
#include <string>

namespace clip_service {

struct FormatSpec {
  std::string selector;      // yt-dlp -f expression
  std::string container;     // --merge-output-format
  std::string extension;     // artifact and object key extension
  std::string content_type;  // object Content-Type
};

class MediaFetcher {
public:
  using StartedCallback = std::function<void()>;

  virtual ~MediaFetcher() = default;
  // Retrieves url into output_path. Leaves size validation to the caller.
  virtual std::expected<void, JobError> fetch(
    const std::string& url,
    const FormatSpec& format,
    const std::filesystem::path& output_path,
    const JobContext& context,
    StartedCallback on_started = nullptr
  ) = 0;
};

} // namespace clip_service
