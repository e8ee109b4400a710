#include "common/config/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <system_error>
#include <utility>

namespace config {

namespace {

std::string trim(std::string_view s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return std::string(s.substr(begin, end - begin + 1));
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string envString(const EnvLookup& env, std::string_view name, std::string fallback) {
  auto value = env(name);
  if (!value || trim(*value).empty()) {
    return fallback;
  }
  return trim(*value);
}

template <typename T>
T envNumber(const EnvLookup& env, std::string_view name, T fallback, T min_value = 0) {
  auto value = env(name);
  if (!value || trim(*value).empty()) {
    return fallback;
  }
  try {
    auto text = trim(*value);
    std::size_t consumed = 0;
    auto parsed = std::stoll(text, &consumed);
    if (consumed != text.size() || std::cmp_less(parsed, min_value) ||
        std::cmp_greater(parsed, std::numeric_limits<T>::max())) {
      throw std::out_of_range("value out of range");
    }
    return static_cast<T>(parsed);
  } catch (const std::exception&) {
    std::cerr << "[config] invalid value for " << name << ": \"" << *value
              << "\", using " << fallback << std::endl;
    return fallback;
  }
}

bool envBool(const EnvLookup& env, std::string_view name, bool fallback) {
  auto value = env(name);
  if (!value || trim(*value).empty()) {
    return fallback;
  }
  auto v = toLower(trim(*value));
  if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
  if (v == "0" || v == "false" || v == "no" || v == "off") return false;
  std::cerr << "[config] invalid boolean for " << name << ": \"" << *value << "\"" << std::endl;
  return fallback;
}

std::vector<std::string> splitList(std::string_view raw) {
  std::vector<std::string> items;
  std::size_t start = 0;
  while (start <= raw.size()) {
    auto comma = raw.find(',', start);
    auto item = trim(raw.substr(start, comma == std::string_view::npos ? std::string_view::npos
                                                                       : comma - start));
    if (!item.empty()) {
      items.push_back(std::move(item));
    }
    if (comma == std::string_view::npos) break;
    start = comma + 1;
  }
  return items;
}

} // namespace

EnvLookup processEnvironment() {
  return [](std::string_view name) -> std::optional<std::string> {
    const char* value = std::getenv(std::string(name).c_str());
    if (!value) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

std::size_t loadDotEnv(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return 0;
  }

  std::size_t exported = 0;
  std::string line;
  while (std::getline(in, line)) {
    auto entry = trim(line);
    if (entry.empty() || entry.front() == '#') {
      continue;
    }
    if (entry.starts_with("export ")) {
      entry = trim(std::string_view(entry).substr(7));
    }
    auto eq = entry.find('=');
    if (eq == std::string::npos || eq == 0) {
      continue;
    }
    auto key = trim(std::string_view(entry).substr(0, eq));
    auto value = trim(std::string_view(entry).substr(eq + 1));
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }
    // overwrite = 0: the real environment wins over the file
    if (::setenv(key.c_str(), value.c_str(), 0) == 0) {
      ++exported;
    }
  }
  return exported;
}

ServerConfig loadServerConfig(const EnvLookup& env) {
  auto port = envNumber<unsigned short>(env, "PORT", 10000, 1);
  auto default_grpc = static_cast<unsigned short>(port <= 64535 ? port + 1000 : 0);
  auto origins = envString(env, "CORS_ORIGIN", "*");
  auto allow_all = origins.empty() || origins == "*";

  return {
    .host = envString(env, "HOST", "0.0.0.0"),
    .port = port,
    .grpc_port = envNumber<unsigned short>(env, "GRPC_PORT", default_grpc),
    .public_dir = envString(env, "PUBLIC_DIR", "public"),
    .allow_all_origins = allow_all,
    .cors_origins = allow_all ? std::vector<std::string>{} : splitList(origins),
    .body_limit = envNumber<std::size_t>(env, "HTTP_BODY_LIMIT", 2 * 1024 * 1024, 1024),
  };
}

ObjectStoreConfig loadObjectStoreConfig(const EnvLookup& env) {
  auto bucket = envString(env, "S3_BUCKET", "");
  if (bucket.empty()) bucket = envString(env, "AWS_BUCKET_NAME", "");
  if (bucket.empty()) bucket = envString(env, "S3_BUCKET_NAME", "");

  auto endpoint = envString(env, "S3_ENDPOINT", "");
  while (!endpoint.empty() && endpoint.back() == '/') {
    endpoint.pop_back();
  }

  // S3 rejects presigned URLs valid for more than 7 days
  constexpr long long kMaxTtl = 7 * 24 * 3600;
  auto ttl = envNumber<long long>(env, "SIGNED_URL_TTL_SEC", 900, 1);
  if (ttl > kMaxTtl) {
    std::cerr << "[config] SIGNED_URL_TTL_SEC clamped to " << kMaxTtl << std::endl;
    ttl = kMaxTtl;
  }

  // S3 rejects non-final parts under 5 MiB and parts over 5 GiB
  constexpr std::size_t kMinPartMb = 5;
  constexpr std::size_t kMaxPartMb = 5 * 1024;
  auto part_mb = envNumber<std::size_t>(env, "S3_PART_SIZE_MB", 8, 1);
  if (part_mb < kMinPartMb || part_mb > kMaxPartMb) {
    part_mb = std::clamp(part_mb, kMinPartMb, kMaxPartMb);
    std::cerr << "[config] S3_PART_SIZE_MB clamped to " << part_mb << std::endl;
  }

  return {
    .region = envString(env, "AWS_REGION", "us-east-1"),
    .bucket = bucket,
    .endpoint = endpoint,
    .path_style = envBool(env, "S3_FORCE_PATH_STYLE", !endpoint.empty()),
    .access_key_id = envString(env, "AWS_ACCESS_KEY_ID", ""),
    .secret_access_key = envString(env, "AWS_SECRET_ACCESS_KEY", ""),
    .session_token = envString(env, "AWS_SESSION_TOKEN", ""),
    .url_ttl = std::chrono::seconds(ttl),
    .key_prefix = envString(env, "S3_KEY_PREFIX", "downloads/"),
    .part_size = part_mb * 1024 * 1024,
    .upload_concurrency = envNumber<std::size_t>(env, "S3_UPLOAD_CONCURRENCY", 3, 1),
  };
}

FetcherConfig loadFetcherConfig(const EnvLookup& env) {
  std::error_code ec;
  auto temp_dir = std::filesystem::temp_directory_path(ec);
  if (ec) {
    temp_dir = "/tmp";
  }

  return {
    .executable = envString(env, "YTDLP_PATH", "yt-dlp"),
    .ffmpeg_location = envString(env, "FFMPEG_PATH", ""),
    .retries = envNumber<int>(env, "YTDLP_RETRIES", 3),
    .no_check_certificates = true,
    .staging_dir = envString(env, "STAGING_DIR", (temp_dir / "clip_service").string()),
  };
}

JobsConfig loadJobsConfig(const EnvLookup& env) {
  auto policy_name = toLower(envString(env, "QUEUE_FULL_POLICY", "reject"));
  auto policy = QueueFullPolicy::Reject;
  if (policy_name == "block") {
    policy = QueueFullPolicy::Block;
  } else if (policy_name != "reject") {
    std::cerr << "[config] unknown QUEUE_FULL_POLICY \"" << policy_name
              << "\", using reject" << std::endl;
  }

  // longer deadlines overflow steady_clock arithmetic
  constexpr long long kMaxTimeout = 7 * 24 * 3600;
  auto timeout = envNumber<long long>(env, "JOB_TIMEOUT_SEC", 1800);
  if (timeout > kMaxTimeout) {
    std::cerr << "[config] JOB_TIMEOUT_SEC clamped to " << kMaxTimeout << std::endl;
    timeout = kMaxTimeout;
  }

  return {
    .max_concurrent_jobs = envNumber<std::size_t>(env, "MAX_CONCURRENT_JOBS", 4, 1),
    .queue_capacity = envNumber<std::size_t>(env, "JOB_QUEUE_CAPACITY", 32, 1),
    .queue_full_policy = policy,
    .job_timeout = std::chrono::seconds(timeout),
  };
}

Config::Config() {
  if (auto exported = loadDotEnv(".env"); exported > 0) {
    std::cout << "[config] loaded " << exported << " variables from .env" << std::endl;
  }

  auto env = processEnvironment();
  server_ = loadServerConfig(env);
  object_store_ = loadObjectStoreConfig(env);
  fetcher_ = loadFetcherConfig(env);
  jobs_ = loadJobsConfig(env);

  if (object_store_.bucket.empty()) {
    std::cerr << "[config] WARN S3 bucket env not set (S3_BUCKET)" << std::endl;
  }
}

} // namespace config
