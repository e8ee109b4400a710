#pragma once

#include "common/config/config.hpp"
#include "domain/media_fetcher.hpp"

#include <expected>
#include <string>
#include <vector>
#include <boost/filesystem/path.hpp>

namespace clip_service {

// Runs yt-dlp as a child process group; stderr is captured for diagnostics.
class YtDlpFetcher : public MediaFetcher {
public:
  explicit YtDlpFetcher(config::FetcherConfig cfg);

  std::expected<void, JobError> fetch(
    const std::string& url,
    const FormatSpec& format,
    const std::filesystem::path& output_path,
    const JobContext& context,
    StartedCallback on_started = nullptr
  ) override;

  std::vector<std::string> buildArguments(
    const std::string& url,
    const FormatSpec& format,
    const std::filesystem::path& output_path
  ) const;

  // Picks ERROR: lines when the tool printed any, else the tail of stderr.
  static std::string summarizeDiagnostics(const std::vector<std::string>& lines);

private:
  std::expected<boost::filesystem::path, JobError> locateExecutable() const;

  config::FetcherConfig cfg_;
};

} // namespace clip_service
