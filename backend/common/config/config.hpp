#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace config {

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

struct ServerConfig {
  std::string host;
  unsigned short port;
  unsigned short grpc_port;  // 0 disables the gRPC listener
  std::string public_dir;
  bool allow_all_origins;
  std::vector<std::string> cors_origins;
  std::size_t body_limit;
};

struct ObjectStoreConfig {
  std::string region;
  std::string bucket;
  std::string endpoint;  // empty means the AWS regional endpoint
  bool path_style;
  std::string access_key_id;
  std::string secret_access_key;
  std::string session_token;
  std::chrono::seconds url_ttl;
  std::string key_prefix;
  std::size_t part_size;
  std::size_t upload_concurrency;
};

struct FetcherConfig {
  std::string executable;
  std::string ffmpeg_location;
  int retries;
  bool no_check_certificates;
  std::filesystem::path staging_dir;
};

enum class QueueFullPolicy { Reject, Block };

struct JobsConfig {
  std::size_t max_concurrent_jobs;
  std::size_t queue_capacity;
  QueueFullPolicy queue_full_policy;
  std::chrono::seconds job_timeout;  // zero disables the deadline
};

EnvLookup processEnvironment();

// Exports KEY=VALUE lines from a dotenv file without overriding variables
// that are already set. Returns the number of variables exported.
std::size_t loadDotEnv(const std::filesystem::path& path);

ServerConfig loadServerConfig(const EnvLookup& env);
ObjectStoreConfig loadObjectStoreConfig(const EnvLookup& env);
FetcherConfig loadFetcherConfig(const EnvLookup& env);
JobsConfig loadJobsConfig(const EnvLookup& env);

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Getters
const ServerConfig& getServer() const { return server_; }
const ObjectStoreConfig& getObjectStore() const { return object_store_; }
const FetcherConfig& getFetcher() const { return fetcher_; }
const JobsConfig& getJobs() const { return jobs_; }
std::string getGrpcIpPort() const { return server_.host + ":" + std::to_string(server_.grpc_port); }

private:
  Config();

  ServerConfig server_;
  ObjectStoreConfig object_store_;
  FetcherConfig fetcher_;
  JobsConfig jobs_;
};

} // namespace config
