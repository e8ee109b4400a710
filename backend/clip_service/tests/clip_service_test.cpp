#include <chrono>
#include <functional>
#include <optional>
#include <memory>
#include <regex>

#include <gtest/gtest.h>

#include "application/clip_service.hpp"
#include "infrastructure/in_memory_job_repository.hpp"
#include "infrastructure/ytdlp_fetcher.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using clip_service::ClipService;
using clip_service::DownloadRequest;
using clip_service::ErrorKind;
using clip_service::HistoryLog;
using clip_service::InMemoryJobRepository;
using clip_service::JobPipeline;
using clip_service::JobStatus;
using clip_service::PipelineSettings;
using clip_service::YtDlpFetcher;
using namespace clip_service::test_support;

// Runs a hook while the pipeline is issuing the download URL.
class IssuanceHookStore : public MemoryObjectStore {
public:
  std::function<void(const std::string& key)> on_presign;

  std::expected<std::string, clip_service::JobError> presignGetUrl(
    const std::string& key, std::chrono::seconds ttl) override {
    if (on_presign) {
      on_presign(key);
    }
    return MemoryObjectStore::presignGetUrl(key, ttl);
  }
};

class ClipServiceTest : public ::testing::Test {
protected:
  std::unique_ptr<ClipService> makeService(const std::filesystem::path& script,
                                           config::JobsConfig jobs = jobsConfig(4, 32),
                                           bool configured = true) {
    store_ = std::make_shared<MemoryObjectStore>(configured);
    auto pipeline = std::make_shared<JobPipeline>(
      repository_, history_,
      std::make_shared<YtDlpFetcher>(fetcherConfig(script, staging_)),
      store_,
      PipelineSettings{.staging_dir = staging_, .key_prefix = "downloads/", .url_ttl = 900s});
    return std::make_unique<ClipService>(repository_, history_, pipeline, store_, jobs);
  }

  std::filesystem::path successScript() {
    return writeFetchScript(dir_ / "fake-yt-dlp", args_file_, "payload");
  }

  std::filesystem::path sleepingScript() {
    return writeScript(dir_ / "slow-yt-dlp", "sleep 30\n");
  }

  static DownloadRequest request(const std::string& type = "video") {
    DownloadRequest req;
    req.url = "https://youtu.be/abc123";
    req.type = type;
    req.quality = "1080p";
    return req;
  }

  TempDir dir_;
  std::filesystem::path staging_ = dir_ / "staging";
  std::filesystem::path args_file_ = dir_ / "args.txt";
  std::shared_ptr<InMemoryJobRepository> repository_ = std::make_shared<InMemoryJobRepository>();
  std::shared_ptr<HistoryLog> history_ = std::make_shared<HistoryLog>();
  std::shared_ptr<MemoryObjectStore> store_;
};

TEST(ClipServiceSource, DetectsPlatform) {
  EXPECT_EQ(ClipService::detectPlatform("https://www.tiktok.com/@u/video/1"), "tiktok");
  EXPECT_EQ(ClipService::detectPlatform("https://www.Instagram.com/reel/x"), "instagram");
  EXPECT_EQ(ClipService::detectPlatform("https://m.facebook.com/watch?v=1"), "facebook");
  EXPECT_EQ(ClipService::detectPlatform("https://fb.watch/abc/"), "facebook");
  EXPECT_EQ(ClipService::detectPlatform("https://youtu.be/abc123"), "youtube");
  EXPECT_EQ(ClipService::detectPlatform("https://vimeo.com/1"), "youtube");
}

TEST(ClipServiceSource, ValidatesUrls) {
  EXPECT_TRUE(ClipService::isValidSourceUrl("https://youtu.be/abc123"));
  EXPECT_TRUE(ClipService::isValidSourceUrl("HTTP://example.com"));
  EXPECT_FALSE(ClipService::isValidSourceUrl(""));
  EXPECT_FALSE(ClipService::isValidSourceUrl("youtu.be/abc123"));
  EXPECT_FALSE(ClipService::isValidSourceUrl("ftp://example.com/a"));
  EXPECT_FALSE(ClipService::isValidSourceUrl("https:///path"));
  EXPECT_FALSE(ClipService::isValidSourceUrl("https://exa mple.com/"));
}

TEST_F(ClipServiceTest, ParseSourceTagsResource) {
  auto service = makeService(successScript());
  auto parsed = service->parseSource("https://www.tiktok.com/@u/video/1");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->platform, "tiktok");
  EXPECT_TRUE(std::regex_match(parsed->resource_id, std::regex("rs_[0-9a-f]{32}")));

  auto invalid = service->parseSource("not a url");
  ASSERT_FALSE(invalid.has_value());
  EXPECT_EQ(invalid.error().kind, ErrorKind::InvalidInput);
}

TEST_F(ClipServiceTest, InvalidInputCreatesNoJob) {
  auto service = makeService(successScript());

  auto bad_url = request();
  bad_url.url = "file:///etc/passwd";
  auto result = service->submitDownload(bad_url);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::InvalidInput);

  auto bad_type = service->submitDownload(request("podcast"));
  ASSERT_FALSE(bad_type.has_value());
  EXPECT_EQ(bad_type.error().kind, ErrorKind::InvalidInput);

  EXPECT_EQ(repository_->size(), 0u);
}

TEST_F(ClipServiceTest, MissingBucketRejectsAdmission) {
  auto service = makeService(successScript(), jobsConfig(4, 32), false);

  auto result = service->submitDownload(request());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::Configuration);
  EXPECT_EQ(repository_->size(), 0u);
  EXPECT_FALSE(std::filesystem::exists(args_file_));
}

TEST_F(ClipServiceTest, AdmittedJobRunsToDone) {
  auto service = makeService(successScript());

  auto job_id = service->submitDownload(request());
  ASSERT_TRUE(job_id.has_value()) << job_id.error().message;

  auto queued = service->getJob(*job_id);
  ASSERT_TRUE(queued.has_value());
  EXPECT_EQ(queued->platform, "youtube");
  EXPECT_TRUE(queued->resource_id.starts_with("rs_"));

  ASSERT_TRUE(waitForTerminal(*repository_, *job_id));
  auto job = service->getJob(*job_id);
  EXPECT_EQ(job->status, JobStatus::Done);
  EXPECT_EQ(job->progress, 100);
  EXPECT_TRUE(job->result_url.has_value());
  EXPECT_GT(job->file_size.value_or(0), 0u);

  auto history = service->listHistory();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].job.id, *job_id);
}

TEST_F(ClipServiceTest, DefaultsApplyToEmptyFields) {
  auto service = makeService(successScript());
  DownloadRequest req;
  req.url = "https://youtu.be/abc123";
  req.type = "";
  req.quality = "";
  req.platform = "custom";
  req.resource_id = "rs_given";

  auto job_id = service->submitDownload(req);
  ASSERT_TRUE(job_id.has_value());
  auto job = service->getJob(*job_id);
  EXPECT_EQ(job->media_type, clip_service::MediaType::Video);
  EXPECT_EQ(job->quality, "1080p");
  EXPECT_EQ(job->platform, "custom");
  EXPECT_EQ(job->resource_id, "rs_given");
}

TEST_F(ClipServiceTest, ConcurrentJobsFinishIndependently) {
  auto service = makeService(successScript());

  auto video = service->submitDownload(request("video"));
  auto audio = service->submitDownload(request("audio"));
  ASSERT_TRUE(video.has_value());
  ASSERT_TRUE(audio.has_value());
  EXPECT_NE(*video, *audio);

  ASSERT_TRUE(waitForTerminal(*repository_, *video));
  ASSERT_TRUE(waitForTerminal(*repository_, *audio));

  auto video_job = *service->getJob(*video);
  auto audio_job = *service->getJob(*audio);
  EXPECT_EQ(video_job.status, JobStatus::Done);
  EXPECT_EQ(audio_job.status, JobStatus::Done);
  EXPECT_EQ(video_job.result_key, "downloads/" + *video + ".mp4");
  EXPECT_EQ(audio_job.result_key, "downloads/" + *audio + ".m4a");
  EXPECT_EQ(store_->object("downloads/" + *video + ".mp4")->second, "video/mp4");
  EXPECT_EQ(store_->object("downloads/" + *audio + ".m4a")->second, "audio/mp4");
  EXPECT_EQ(service->listHistory().size(), 2u);
}

TEST_F(ClipServiceTest, QueueFullRejectsWithoutCreatingJob) {
  auto service = makeService(sleepingScript(), jobsConfig(1, 1));

  auto running = service->submitDownload(request());
  ASSERT_TRUE(running.has_value());
  ASSERT_TRUE(waitFor([&]() { return service->getJob(*running)->status == JobStatus::Processing; }));

  auto queued = service->submitDownload(request());
  ASSERT_TRUE(queued.has_value());

  auto rejected = service->submitDownload(request());
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error().kind, ErrorKind::QueueFull);
  EXPECT_EQ(repository_->size(), 2u);

  service->shutdown();
  EXPECT_EQ(service->getJob(*running)->error_kind, ErrorKind::Cancelled);
  EXPECT_EQ(service->getJob(*queued)->error_kind, ErrorKind::Cancelled);

  auto after = service->submitDownload(request());
  ASSERT_FALSE(after.has_value());
  EXPECT_EQ(after.error().kind, ErrorKind::QueueFull);
}

TEST_F(ClipServiceTest, CancelRunningJob) {
  auto service = makeService(sleepingScript());

  auto job_id = service->submitDownload(request());
  ASSERT_TRUE(job_id.has_value());
  ASSERT_TRUE(waitFor([&]() { return service->getJob(*job_id)->status == JobStatus::Processing; }));

  ASSERT_TRUE(service->cancelJob(*job_id).has_value());
  ASSERT_TRUE(waitForTerminal(*repository_, *job_id));

  auto job = *service->getJob(*job_id);
  EXPECT_EQ(job.status, JobStatus::Error);
  EXPECT_EQ(job.error_kind, ErrorKind::Cancelled);
  EXPECT_TRUE(filesWithPrefix(staging_, *job_id).empty());

  auto again = service->cancelJob(*job_id);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().kind, ErrorKind::InvalidInput);
}

TEST_F(ClipServiceTest, CancelAcknowledgedDuringIssuanceEndsCancelled) {
  auto store = std::make_shared<IssuanceHookStore>();
  auto pipeline = std::make_shared<JobPipeline>(
    repository_, history_,
    std::make_shared<YtDlpFetcher>(fetcherConfig(successScript(), staging_)),
    store,
    PipelineSettings{.staging_dir = staging_, .key_prefix = "downloads/", .url_ttl = 900s});
  auto service = std::make_unique<ClipService>(repository_, history_, pipeline, store,
                                               jobsConfig(1, 4));

  std::optional<std::expected<void, clip_service::JobError>> cancel_result;
  store->on_presign = [&](const std::string& key) {
    // downloads/<job id>.mp4
    auto id = key.substr(10, key.rfind('.') - 10);
    cancel_result = service->cancelJob(id);
  };

  auto submitted = service->submitDownload(request());
  ASSERT_TRUE(submitted.has_value());
  auto job_id = *submitted;
  ASSERT_TRUE(waitForTerminal(*repository_, job_id));

  ASSERT_TRUE(cancel_result.has_value());
  EXPECT_TRUE(cancel_result->has_value());
  auto job = *service->getJob(job_id);
  EXPECT_EQ(job.status, JobStatus::Error);
  EXPECT_EQ(job.error_kind, ErrorKind::Cancelled);
}

TEST_F(ClipServiceTest, UnknownJobIsNotFound) {
  auto service = makeService(successScript());
  EXPECT_EQ(service->getJob("job_nope").error().kind, ErrorKind::NotFound);
  EXPECT_EQ(service->cancelJob("job_nope").error().kind, ErrorKind::NotFound);
}

TEST_F(ClipServiceTest, BlockPolicyWaitsForSlot) {
  auto script = writeScript(dir_ / "brief-yt-dlp",
    "out=\"\"\n"
    "while [ $# -gt 0 ]; do case \"$1\" in -o) out=\"$2\"; shift 2;; *) shift;; esac; done\n"
    "sleep 0.2\n"
    "printf 'payload' > \"$out\"\n");
  auto service = makeService(script, jobsConfig(1, 1, config::QueueFullPolicy::Block));

  std::vector<std::string> ids;
  for (int i = 0; i < 4; ++i) {
    auto job_id = service->submitDownload(request());
    ASSERT_TRUE(job_id.has_value());
    ids.push_back(*job_id);
  }
  for (const auto& id : ids) {
    ASSERT_TRUE(waitForTerminal(*repository_, id));
    EXPECT_EQ(service->getJob(id)->status, JobStatus::Done);
  }
}

} // namespace
