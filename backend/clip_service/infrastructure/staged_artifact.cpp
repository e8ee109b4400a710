#include "staged_artifact.hpp"

#include <iostream>
#include <system_error>
#include <vector>

namespace clip_service {

StagedArtifact::StagedArtifact(const std::filesystem::path& staging_dir,
                               const std::string& job_id,
                               const std::string& extension)
  : dir_(staging_dir), prefix_(job_id + "."), path_(staging_dir / (job_id + "." + extension)) {}

StagedArtifact::~StagedArtifact() {
  remove();
}

std::expected<std::uintmax_t, std::string> StagedArtifact::size() const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec)) {
    return std::unexpected("Artifact not found: " + path_.string());
  }
  auto bytes = std::filesystem::file_size(path_, ec);
  if (ec) {
    return std::unexpected("Failed to stat artifact: " + ec.message());
  }
  return bytes;
}

std::size_t StagedArtifact::remove() noexcept {
  std::size_t removed = 0;
  try {
    std::error_code ec;
    std::vector<std::filesystem::path> victims;
    for (std::filesystem::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
      if (it->path().filename().string().starts_with(prefix_)) {
        victims.push_back(it->path());
      }
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
      std::cerr << "[artifact] cannot scan " << dir_ << ": " << ec.message() << std::endl;
    }

    for (const auto& victim : victims) {
      std::error_code rm_ec;
      if (std::filesystem::remove(victim, rm_ec)) {
        ++removed;
      } else if (rm_ec) {
        std::cerr << "[artifact] failed to remove " << victim << ": " << rm_ec.message() << std::endl;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "[artifact] cleanup of " << path_ << " failed: " << e.what() << std::endl;
  }
  return removed;
}

} // namespace clip_service
