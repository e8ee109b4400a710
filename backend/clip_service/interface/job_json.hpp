#pragma once
#include "domain/job.hpp"

#include <nlohmann/json.hpp>

namespace clip_service {

nlohmann::json jobToJson(const Job& job);

// History item: the job as of its terminal transition plus "at" (epoch ms).
nlohmann::json historyEntryToJson(const HistoryEntry& entry);

std::int64_t epochMillis(std::chrono::system_clock::time_point tp);

} // namespace clip_service
