#pragma once

#include "common/config/config.hpp"
#include "domain/object_store.hpp"
#include "infrastructure/aws_sigv4.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <vector>
#include <curl/curl.h>

namespace clip_service {

// Aggregates upload progress across parts sent in parallel: bytes of
// completed parts plus bytes curl reports in flight for the open ones.
class TransferMeter {
public:
  TransferMeter(std::uint64_t total, ObjectStore::TransferProgress progress);

  // part_reported is the caller's per-part cursor, reset to 0 for each part.
  void inFlight(std::uint64_t& part_reported, std::uint64_t part_now);
  void partDone(std::uint64_t& part_reported, std::uint64_t length);
  void partFailed(std::uint64_t& part_reported);

  std::uint64_t sent() const { return sent_.load(); }

private:
  void report();

  std::uint64_t total_;
  ObjectStore::TransferProgress progress_;
  std::atomic<std::uint64_t> sent_{0};
  std::atomic<std::uint64_t> in_flight_{0};
};

// S3-compatible object store client: multipart upload over libcurl, requests
// and presigned URLs signed with SigV4.
class S3ObjectStore : public ObjectStore {
public:
  explicit S3ObjectStore(config::ObjectStoreConfig cfg);
  ~S3ObjectStore() override;

  S3ObjectStore(const S3ObjectStore&) = delete;
  S3ObjectStore& operator=(const S3ObjectStore&) = delete;

  bool configured() const override { return !cfg_.bucket.empty(); }

  std::expected<std::uint64_t, JobError> putObject(
    const std::string& key,
    const std::filesystem::path& file,
    const std::string& content_type,
    const JobContext& context,
    TransferProgress progress = nullptr
  ) override;

  std::expected<std::string, JobError> presignGetUrl(
    const std::string& key,
    std::chrono::seconds ttl
  ) override;

  static constexpr std::uint64_t kMaxParts = 10000;

  // Configured part size, raised so that total fits in kMaxParts parts.
  static std::uint64_t partSizeFor(std::uint64_t total, std::uint64_t configured);

  // scheme://host[:port] and canonical path of an object, per addressing style
  std::string objectOrigin() const;
  std::string objectPath(const std::string& key) const;

private:
  struct HttpResponse {
    long status{0};
    std::string body;
    std::string etag;
  };

  struct PartResult {
    int number;
    std::string etag;
  };

  std::expected<HttpResponse, std::string> perform(
    const std::string& method,
    const std::string& key,
    const QueryList& query,
    HeaderList headers,
    const std::string& body,
    const JobContext* context,
    const std::atomic_bool* abort_flag,
    const std::function<void(std::uint64_t)>* on_upload = nullptr
  ) const;

  std::expected<std::string, std::string> createMultipartUpload(
    const std::string& key, const std::string& content_type, const JobContext& context) const;
  std::expected<std::string, std::string> uploadPart(
    const std::string& key, const std::string& upload_id, int part_number,
    const std::string& data, const JobContext& context, const std::atomic_bool& abort_flag,
    const std::function<void(std::uint64_t)>& on_upload) const;
  std::expected<void, std::string> completeMultipartUpload(
    const std::string& key, const std::string& upload_id,
    const std::vector<PartResult>& parts, const JobContext& context) const;
  void abortMultipartUpload(const std::string& key, const std::string& upload_id) const;

  static std::string describeError(const HttpResponse& response);
  static std::string xmlValue(const std::string& xml, const std::string& tag);

  static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata);
  static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
  static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                              curl_off_t ultotal, curl_off_t ulnow);

  config::ObjectStoreConfig cfg_;
  SigV4Signer signer_;
  std::string scheme_;
  std::string host_;
};

} // namespace clip_service
