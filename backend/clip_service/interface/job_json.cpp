#include "job_json.hpp"

namespace clip_service {

std::int64_t epochMillis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

nlohmann::json jobToJson(const Job& job) {
  nlohmann::json json = {
    {"jobId", job.id},
    {"status", toString(job.status)},
    {"progress", job.progress},
    {"type", toString(job.media_type)},
    {"quality", job.quality},
    {"url", job.source_url},
    {"platform", job.platform},
    {"resourceId", job.resource_id},
    {"createdAt", epochMillis(job.created_at)},
    {"updatedAt", epochMillis(job.updated_at)}
  };

  if (job.result_url) json["downloadUrl"] = *job.result_url;
  if (job.result_key) json["fileKey"] = *job.result_key;
  if (job.file_size) json["fileSize"] = *job.file_size;
  if (job.error_message) json["error"] = *job.error_message;
  if (job.error_kind) json["errorKind"] = toString(*job.error_kind);
  return json;
}

nlohmann::json historyEntryToJson(const HistoryEntry& entry) {
  auto json = jobToJson(entry.job);
  json["at"] = epochMillis(entry.captured_at);
  return json;
}

} // namespace clip_service
