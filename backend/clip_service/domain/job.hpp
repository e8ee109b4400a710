#pragma once
#include "domain/job_error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace clip_service {

enum class JobStatus { Queued, Processing, Done, Error };

enum class MediaType { Video, Audio };

struct Job {
  std::string id;
  JobStatus status{JobStatus::Queued};
  int progress{0};  // 0..100, only moves forward until an error resets it
  MediaType media_type{MediaType::Video};
  std::string quality;
  std::string source_url;
  std::string platform;
  std::string resource_id;

  // set only when status == Done
  std::optional<std::string> result_key;
  std::optional<std::string> result_url;
  std::optional<std::uint64_t> file_size;

  // set only when status == Error
  std::optional<std::string> error_message;
  std::optional<ErrorKind> error_kind;

  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;

  bool terminal() const { return status == JobStatus::Done || status == JobStatus::Error; }
};

// Snapshot of a job taken when it reached a terminal state.
struct HistoryEntry {
  Job job;
  std::chrono::system_clock::time_point captured_at;
};

inline const char* toString(JobStatus status) {
  switch (status) {
    case JobStatus::Queued: return "queued";
    case JobStatus::Processing: return "processing";
    case JobStatus::Done: return "done";
    case JobStatus::Error: return "error";
  }
  return "unknown";
}

inline const char* toString(MediaType type) {
  return type == MediaType::Audio ? "audio" : "video";
}

inline std::optional<MediaType> parseMediaType(std::string_view name) {
  std::string lower;
  for (char c : name) {
    lower.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c));
  }
  if (lower == "video") return MediaType::Video;
  if (lower == "audio") return MediaType::Audio;
  return std::nullopt;
}

} // namespace clip_service
