#pragma once
#include "domain/job.hpp"
#include "domain/media_fetcher.hpp"

#include <string_view>

namespace clip_service {

// Maps a media type and quality tier to the yt-dlp format to request.
// Unknown tiers fall back to the 720p policy.
FormatSpec resolveFormat(MediaType type, std::string_view quality);

// Minimum vertical resolution requested for a video tier.
int heightFloor(std::string_view quality);

} // namespace clip_service
