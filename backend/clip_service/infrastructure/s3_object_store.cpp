#include "s3_object_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>

namespace clip_service {

namespace {

struct TransferGuard {
  const JobContext* context;
  const std::atomic_bool* abort_flag;
  const std::function<void(std::uint64_t)>* on_upload;
};

bool startsWithNoCase(const std::string& s, const std::string& prefix) {
  if (s.size() < prefix.size()) return false;
  return std::equal(prefix.begin(), prefix.end(), s.begin(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
  });
}

}

TransferMeter::TransferMeter(std::uint64_t total, ObjectStore::TransferProgress progress)
  : total_(total), progress_(std::move(progress)) {}

void TransferMeter::inFlight(std::uint64_t& part_reported, std::uint64_t part_now) {
  if (part_now <= part_reported) {
    return;
  }
  in_flight_.fetch_add(part_now - part_reported);
  part_reported = part_now;
  report();
}

void TransferMeter::partDone(std::uint64_t& part_reported, std::uint64_t length) {
  in_flight_.fetch_sub(part_reported);
  part_reported = 0;
  sent_.fetch_add(length);
  report();
}

void TransferMeter::partFailed(std::uint64_t& part_reported) {
  in_flight_.fetch_sub(part_reported);
  part_reported = 0;
}

void TransferMeter::report() {
  if (progress_) {
    progress_(std::min(total_, sent_.load() + in_flight_.load()), total_);
  }
}

std::uint64_t S3ObjectStore::partSizeFor(std::uint64_t total, std::uint64_t configured) {
  auto minimum = (total + kMaxParts - 1) / kMaxParts;
  return std::max<std::uint64_t>({configured, minimum, 1});
}

S3ObjectStore::S3ObjectStore(config::ObjectStoreConfig cfg)
  : cfg_(std::move(cfg)),
    signer_(AwsCredentials{cfg_.access_key_id, cfg_.secret_access_key, cfg_.session_token},
            cfg_.region) {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("Failed to initialize CURL");
  }

  std::string authority;
  if (cfg_.endpoint.empty()) {
    scheme_ = "https";
    authority = "s3." + cfg_.region + ".amazonaws.com";
  } else {
    auto sep = cfg_.endpoint.find("://");
    scheme_ = sep == std::string::npos ? "https" : cfg_.endpoint.substr(0, sep);
    authority = sep == std::string::npos ? cfg_.endpoint : cfg_.endpoint.substr(sep + 3);
    authority = authority.substr(0, authority.find('/'));
  }
  host_ = cfg_.path_style || cfg_.bucket.empty() ? authority : cfg_.bucket + "." + authority;
}

S3ObjectStore::~S3ObjectStore() {
  curl_global_cleanup();
}

std::string S3ObjectStore::objectOrigin() const {
  return scheme_ + "://" + host_;
}

std::string S3ObjectStore::objectPath(const std::string& key) const {
  auto encoded_key = SigV4Signer::uriEncode(key, false);
  if (cfg_.path_style) {
    return "/" + cfg_.bucket + "/" + encoded_key;
  }
  return "/" + encoded_key;
}

size_t S3ObjectStore::writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

size_t S3ObjectStore::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* response = static_cast<HttpResponse*>(userdata);
  std::string line(buffer, size * nitems);
  if (startsWithNoCase(line, "etag:")) {
    auto value = line.substr(5);
    auto begin = value.find_first_not_of(" \t");
    auto end = value.find_last_not_of(" \t\r\n");
    response->etag = begin == std::string::npos ? "" : value.substr(begin, end - begin + 1);
  }
  return size * nitems;
}

int S3ObjectStore::progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t,
                                    curl_off_t ulnow) {
  auto* guard = static_cast<TransferGuard*>(clientp);
  if (guard->abort_flag && guard->abort_flag->load()) {
    return 1;
  }
  if (guard->context && guard->context->cancelled()) {
    return 1;
  }
  if (guard->on_upload && *guard->on_upload && ulnow > 0) {
    // nothing may unwind through libcurl; a failing observer aborts the transfer
    try {
      (*guard->on_upload)(static_cast<std::uint64_t>(ulnow));
    } catch (const std::exception& e) {
      std::cerr << "[s3] progress observer failed: " << e.what() << std::endl;
      return 1;
    }
  }
  return 0;
}

std::expected<S3ObjectStore::HttpResponse, std::string> S3ObjectStore::perform(
    const std::string& method,
    const std::string& key,
    const QueryList& query,
    HeaderList headers,
    const std::string& body,
    const JobContext* context,
    const std::atomic_bool* abort_flag,
    const std::function<void(std::uint64_t)>* on_upload) const {

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
  if (!curl) {
    return std::unexpected("Failed to initialize CURL");
  }

  auto path = objectPath(key);
  auto query_string = SigV4Signer::canonicalQuery(query);
  auto url = objectOrigin() + path + (query_string.empty() ? "" : "?" + query_string);

  auto signed_headers = signer_.signHeaders(method, host_, path, query, headers,
                                            SigV4Signer::sha256Hex(body),
                                            std::chrono::system_clock::now());
  headers.insert(headers.end(), signed_headers.begin(), signed_headers.end());

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(nullptr, curl_slist_free_all);
  for (const auto& [name, value] : headers) {
    header_list.reset(curl_slist_append(header_list.release(), (name + ": " + value).c_str()));
  }
  // no 100-continue round trip before part bodies
  header_list.reset(curl_slist_append(header_list.release(), "Expect:"));

  HttpResponse response;
  TransferGuard guard{context, abort_flag, on_upload};

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &guard);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 15L);
  curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, 60L);

  if (method == "POST") {
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
  } else if (method == "PUT") {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "PUT");
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
  } else if (method != "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
  }

  auto res = curl_easy_perform(curl.get());
  if (res == CURLE_ABORTED_BY_CALLBACK) {
    return std::unexpected("transfer aborted");
  }
  if (res != CURLE_OK) {
    return std::unexpected(curl_easy_strerror(res));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

std::string S3ObjectStore::xmlValue(const std::string& xml, const std::string& tag) {
  auto open = "<" + tag + ">";
  auto begin = xml.find(open);
  if (begin == std::string::npos) {
    return {};
  }
  begin += open.size();
  auto end = xml.find("</" + tag + ">", begin);
  if (end == std::string::npos) {
    return {};
  }
  return xml.substr(begin, end - begin);
}

std::string S3ObjectStore::describeError(const HttpResponse& response) {
  std::string message = "HTTP " + std::to_string(response.status);
  auto code = xmlValue(response.body, "Code");
  auto text = xmlValue(response.body, "Message");
  if (!code.empty()) message += " " + code;
  if (!text.empty()) message += ": " + text;
  return message;
}

std::expected<std::string, std::string> S3ObjectStore::createMultipartUpload(
    const std::string& key, const std::string& content_type, const JobContext& context) const {
  auto response = perform("POST", key, {{"uploads", ""}}, {{"Content-Type", content_type}}, "",
                          &context, nullptr);
  if (!response) {
    return std::unexpected(response.error());
  }
  if (response->status != 200) {
    return std::unexpected(describeError(*response));
  }
  auto upload_id = xmlValue(response->body, "UploadId");
  if (upload_id.empty()) {
    return std::unexpected("response carries no UploadId");
  }
  return upload_id;
}

std::expected<std::string, std::string> S3ObjectStore::uploadPart(
    const std::string& key, const std::string& upload_id, int part_number,
    const std::string& data, const JobContext& context, const std::atomic_bool& abort_flag,
    const std::function<void(std::uint64_t)>& on_upload) const {
  auto response = perform("PUT", key,
                          {{"partNumber", std::to_string(part_number)}, {"uploadId", upload_id}},
                          {}, data, &context, &abort_flag, &on_upload);
  if (!response) {
    return std::unexpected(response.error());
  }
  if (response->status != 200) {
    return std::unexpected(describeError(*response));
  }
  if (response->etag.empty()) {
    return std::unexpected("response carries no ETag");
  }
  return response->etag;
}

std::expected<void, std::string> S3ObjectStore::completeMultipartUpload(
    const std::string& key, const std::string& upload_id,
    const std::vector<PartResult>& parts, const JobContext& context) const {
  std::string body = "<CompleteMultipartUpload>";
  for (const auto& part : parts) {
    body += "<Part><PartNumber>" + std::to_string(part.number) + "</PartNumber><ETag>" +
            part.etag + "</ETag></Part>";
  }
  body += "</CompleteMultipartUpload>";

  auto response = perform("POST", key, {{"uploadId", upload_id}},
                          {{"Content-Type", "application/xml"}}, body, &context, nullptr);
  if (!response) {
    return std::unexpected(response.error());
  }
  // S3 may report a failed completion inside a 200 response
  if (response->status != 200 || response->body.find("<Error>") != std::string::npos) {
    return std::unexpected(describeError(*response));
  }
  return {};
}

void S3ObjectStore::abortMultipartUpload(const std::string& key, const std::string& upload_id) const {
  auto response = perform("DELETE", key, {{"uploadId", upload_id}}, {}, "", nullptr, nullptr);
  if (!response) {
    std::cerr << "[s3] abort of upload " << upload_id << " failed: " << response.error() << std::endl;
  } else if (response->status != 204 && response->status != 200) {
    std::cerr << "[s3] abort of upload " << upload_id << " failed: " << describeError(*response)
              << std::endl;
  }
}

std::expected<std::uint64_t, JobError> S3ObjectStore::putObject(
    const std::string& key,
    const std::filesystem::path& file,
    const std::string& content_type,
    const JobContext& context,
    TransferProgress progress) {

  if (!configured()) {
    return std::unexpected(JobError{ErrorKind::Configuration, "S3 bucket is not configured"});
  }

  std::error_code ec;
  std::uint64_t total = std::filesystem::file_size(file, ec);
  if (ec) {
    return std::unexpected(JobError{ErrorKind::Transfer,
                                    "Cannot read artifact " + file.string() + ": " + ec.message()});
  }

  if (context.cancelled()) {
    return std::unexpected(context.interruption());
  }

  auto upload_id = createMultipartUpload(key, content_type, context);
  if (!upload_id) {
    if (context.cancelled()) {
      return std::unexpected(context.interruption());
    }
    return std::unexpected(JobError{ErrorKind::Transfer,
                                    "Failed to start multipart upload: " + upload_id.error()});
  }

  const std::uint64_t part_size = partSizeFor(total, cfg_.part_size);
  const int part_count = static_cast<int>(std::max<std::uint64_t>(1, (total + part_size - 1) / part_size));

  std::atomic<int> next_part{1};
  TransferMeter meter(total, std::move(progress));
  std::atomic_bool abort_flag{false};
  std::mutex error_mutex;
  std::optional<std::string> first_error;
  std::vector<std::string> etags(part_count);

  auto fail = [&](std::string message) {
    std::lock_guard<std::mutex> lock(error_mutex);
    if (!first_error) {
      first_error = std::move(message);
    }
    abort_flag.store(true);
  };

  auto worker = [&]() {
    try {
      std::ifstream in(file, std::ios::binary);
      if (!in) {
        fail("Failed to open artifact " + file.string());
        return;
      }

      std::string buffer;
      std::uint64_t part_reported = 0;
      std::function<void(std::uint64_t)> on_upload = [&](std::uint64_t now) {
        meter.inFlight(part_reported, now);
      };
      while (!abort_flag.load()) {
        int part = next_part.fetch_add(1);
        if (part > part_count) {
          break;
        }
        if (context.cancelled()) {
          abort_flag.store(true);
          break;
        }

        std::uint64_t offset = static_cast<std::uint64_t>(part - 1) * part_size;
        auto length = static_cast<std::size_t>(std::min(part_size, total - offset));
        buffer.resize(length);
        in.seekg(static_cast<std::streamoff>(offset));
        in.read(buffer.data(), static_cast<std::streamsize>(length));
        if (static_cast<std::size_t>(in.gcount()) != length) {
          fail("Short read of part " + std::to_string(part) + " from " + file.string());
          break;
        }

        auto etag = uploadPart(key, *upload_id, part, buffer, context, abort_flag, on_upload);
        if (!etag) {
          meter.partFailed(part_reported);
          if (!context.cancelled()) {
            fail("Part " + std::to_string(part) + ": " + etag.error());
          }
          break;
        }
        etags[part - 1] = std::move(*etag);
        meter.partDone(part_reported, length);
      }
    } catch (const std::exception& e) {
      fail(e.what());
    }
  };

  auto thread_count = std::min<std::size_t>(std::max<std::size_t>(cfg_.upload_concurrency, 1),
                                            static_cast<std::size_t>(part_count));
  std::vector<std::future<void>> workers;
  workers.reserve(thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) {
    workers.emplace_back(std::async(std::launch::async, worker));
  }
  for (auto& w : workers) {
    w.wait();
  }

  if (!first_error && context.cancelled()) {
    abortMultipartUpload(key, *upload_id);
    return std::unexpected(context.interruption());
  }
  if (first_error) {
    abortMultipartUpload(key, *upload_id);
    return std::unexpected(JobError{ErrorKind::Transfer, "Upload failed: " + *first_error});
  }
  if (meter.sent() != total) {
    abortMultipartUpload(key, *upload_id);
    return std::unexpected(JobError{
      ErrorKind::Transfer,
      "Upload size mismatch: sent " + std::to_string(meter.sent()) + " of " +
        std::to_string(total) + " bytes"});
  }

  std::vector<PartResult> parts;
  parts.reserve(part_count);
  for (int i = 0; i < part_count; ++i) {
    parts.push_back({i + 1, etags[i]});
  }

  auto completed = completeMultipartUpload(key, *upload_id, parts, context);
  if (!completed) {
    abortMultipartUpload(key, *upload_id);
    if (context.cancelled()) {
      return std::unexpected(context.interruption());
    }
    return std::unexpected(JobError{ErrorKind::Transfer,
                                    "Failed to complete multipart upload: " + completed.error()});
  }

  return meter.sent();
}

std::expected<std::string, JobError> S3ObjectStore::presignGetUrl(
    const std::string& key,
    std::chrono::seconds ttl) {

  if (!configured()) {
    return std::unexpected(JobError{ErrorKind::Issuance, "S3 bucket is not configured"});
  }
  if (cfg_.access_key_id.empty() || cfg_.secret_access_key.empty()) {
    return std::unexpected(JobError{ErrorKind::Issuance, "AWS credentials are not configured"});
  }

  try {
    auto path = objectPath(key);
    auto query = signer_.presignQuery("GET", host_, path, ttl, std::chrono::system_clock::now());
    return objectOrigin() + path + "?" + query;
  } catch (const std::exception& e) {
    return std::unexpected(JobError{ErrorKind::Issuance,
                                    "Failed to sign URL: " + std::string(e.what())});
  }
}

} // namespace clip_service
