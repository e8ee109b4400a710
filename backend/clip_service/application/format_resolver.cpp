#include "format_resolver.hpp"

#include <string>

namespace clip_service {

namespace {

std::string lowered(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    out.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c));
  }
  return out;
}

}

int heightFloor(std::string_view quality) {
  auto tier = lowered(quality);
  if (tier == "4k" || tier == "2160p") {
    return 2160;
  }
  if (tier == "1080p") {
    return 1080;
  }
  return 720;
}

FormatSpec resolveFormat(MediaType type, std::string_view quality) {
  if (type == MediaType::Audio) {
    return FormatSpec{
      .selector = "bestaudio[ext=m4a]/bestaudio",
      .container = "m4a",
      .extension = "m4a",
      .content_type = "audio/mp4"
    };
  }

  auto floor = std::to_string(heightFloor(quality));
  return FormatSpec{
    .selector = "bestvideo[height>=" + floor + "][ext=mp4]+bestaudio[ext=m4a]/best[ext=mp4]/best",
    .container = "mp4",
    .extension = "mp4",
    .content_type = "video/mp4"
  };
}

} // namespace clip_service
