#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace clip_service {

// Job-scoped file in the staging directory. The destructor removes the file
// and every sibling sharing the job id prefix (partial downloads, per-format
// intermediates). Removal failures are logged, never thrown.
class StagedArtifact {
public:
  StagedArtifact(const std::filesystem::path& staging_dir,
                 const std::string& job_id,
                 const std::string& extension);
  ~StagedArtifact();

  StagedArtifact(const StagedArtifact&) = delete;
  StagedArtifact& operator=(const StagedArtifact&) = delete;

  const std::filesystem::path& path() const { return path_; }

  // Size of the staged file; an error when it does not exist.
  std::expected<std::uintmax_t, std::string> size() const;

  // Removes the artifact now. Returns the number of files removed.
  std::size_t remove() noexcept;

private:
  std::filesystem::path dir_;
  std::string prefix_;
  std::filesystem::path path_;
};

} // namespace clip_service
