#include <algorithm>
#include <chrono>
#include <stop_token>
#include <thread>

#include <gtest/gtest.h>

#include "application/format_resolver.hpp"
#include "infrastructure/ytdlp_fetcher.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using clip_service::ErrorKind;
using clip_service::JobContext;
using clip_service::MediaType;
using clip_service::YtDlpFetcher;
using clip_service::resolveFormat;
using namespace clip_service::test_support;

class YtDlpFetcherTest : public ::testing::Test {
protected:
  TempDir dir_;
  std::filesystem::path output_ = dir_ / "job_1.mp4";
  clip_service::FormatSpec format_ = resolveFormat(MediaType::Video, "1080p");

  YtDlpFetcher fetcherFor(const std::filesystem::path& script) {
    return YtDlpFetcher(fetcherConfig(script, dir_.path()));
  }
};

TEST_F(YtDlpFetcherTest, BuildsArgumentList) {
  auto cfg = fetcherConfig("yt-dlp", dir_.path());
  cfg.ffmpeg_location = "/opt/ffmpeg/bin";
  YtDlpFetcher fetcher(cfg);

  auto args = fetcher.buildArguments("https://youtu.be/abc123", format_, output_);
  std::vector<std::string> expected = {
    "-f", format_.selector,
    "-o", output_.string(),
    "--merge-output-format", "mp4",
    "--retries", "3",
    "--no-playlist",
    "--no-progress",
    "--no-check-certificates",
    "--ffmpeg-location", "/opt/ffmpeg/bin",
    "--", "https://youtu.be/abc123",
  };
  EXPECT_EQ(args, expected);
}

TEST_F(YtDlpFetcherTest, SummaryPrefersErrorLines) {
  auto summary = YtDlpFetcher::summarizeDiagnostics({
    "[youtube] abc123: Downloading webpage",
    "WARNING: unable to extract uploader",
    "ERROR: [youtube] abc123: Video unavailable",
  });
  EXPECT_EQ(summary, "ERROR: [youtube] abc123: Video unavailable");
}

TEST_F(YtDlpFetcherTest, SummaryFallsBackToTail) {
  std::vector<std::string> lines;
  for (int i = 0; i < 10; ++i) {
    lines.push_back("line " + std::to_string(i));
  }
  lines.push_back("   ");
  EXPECT_EQ(YtDlpFetcher::summarizeDiagnostics(lines), "line 5\nline 6\nline 7\nline 8\nline 9");
  EXPECT_EQ(YtDlpFetcher::summarizeDiagnostics({}), "no diagnostic output");
}

TEST_F(YtDlpFetcherTest, SummaryIsBounded) {
  auto summary = YtDlpFetcher::summarizeDiagnostics({"ERROR: " + std::string(5000, 'x')});
  EXPECT_LE(summary.size(), 2003u);
}

TEST_F(YtDlpFetcherTest, SuccessfulRunProducesArtifact) {
  auto args_file = dir_ / "args.txt";
  auto script = writeFetchScript(dir_ / "fake-yt-dlp", args_file, "media-bytes");
  auto fetcher = fetcherFor(script);

  bool started = false;
  auto result = fetcher.fetch("https://youtu.be/abc123", format_, output_, JobContext{},
                              [&started]() { started = true; });

  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_TRUE(started);
  EXPECT_EQ(readFile(output_), "media-bytes");

  auto args = readLines(args_file);
  ASSERT_FALSE(args.empty());
  EXPECT_EQ(args.back(), "https://youtu.be/abc123");
  EXPECT_NE(std::find(args.begin(), args.end(), "--no-check-certificates"), args.end());
  EXPECT_NE(std::find(args.begin(), args.end(), format_.selector), args.end());
}

TEST_F(YtDlpFetcherTest, NonZeroExitCarriesDiagnostics) {
  auto script = writeScript(dir_ / "fake-yt-dlp",
    "echo '[youtube] abc123: Downloading webpage' >&2\n"
    "echo 'ERROR: [youtube] abc123: Video unavailable' >&2\n"
    "exit 1\n");
  auto fetcher = fetcherFor(script);

  auto result = fetcher.fetch("https://youtu.be/abc123", format_, output_, JobContext{});

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::Fetch);
  EXPECT_NE(result.error().message.find("exited with code 1"), std::string::npos);
  EXPECT_NE(result.error().message.find("Video unavailable"), std::string::npos);
  EXPECT_EQ(result.error().message.find("Downloading webpage"), std::string::npos);
}

TEST_F(YtDlpFetcherTest, MissingExecutableIsFetchError) {
  auto fetcher = fetcherFor(dir_ / "no-such-tool");
  auto result = fetcher.fetch("https://youtu.be/abc123", format_, output_, JobContext{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::Fetch);
  EXPECT_NE(result.error().message.find("not found"), std::string::npos);

  YtDlpFetcher not_on_path(fetcherConfig("clip-service-no-such-tool", dir_.path()));
  EXPECT_FALSE(not_on_path.fetch("https://youtu.be/abc123", format_, output_, JobContext{}));
}

TEST_F(YtDlpFetcherTest, CancellationTerminatesTool) {
  auto script = writeScript(dir_ / "fake-yt-dlp", "sleep 30\n");
  auto fetcher = fetcherFor(script);
  std::stop_source stop;

  std::jthread canceller([&stop]() {
    std::this_thread::sleep_for(300ms);
    stop.request_stop();
  });

  auto begin = std::chrono::steady_clock::now();
  auto result = fetcher.fetch("https://youtu.be/abc123", format_, output_,
                              JobContext(stop.get_token(), std::nullopt));
  auto elapsed = std::chrono::steady_clock::now() - begin;

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
  EXPECT_LT(elapsed, 10s);
}

TEST_F(YtDlpFetcherTest, DeadlineTerminatesTool) {
  auto script = writeScript(dir_ / "fake-yt-dlp", "sleep 30\n");
  auto fetcher = fetcherFor(script);

  auto result = fetcher.fetch("https://youtu.be/abc123", format_, output_,
                              JobContext({}, JobContext::Clock::now() + 300ms));

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::Timeout);
}

} // namespace
