#include "ytdlp_fetcher.hpp"

#include <chrono>
#include <deque>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>
#include <boost/filesystem/operations.hpp>
#include <boost/process.hpp>

namespace bp = boost::process;

namespace clip_service {

namespace {

constexpr std::size_t kMaxTailLines = 5;
constexpr std::size_t kMaxKeptLines = 64;
constexpr std::size_t kMaxDiagnosticLength = 2000;
constexpr auto kPollInterval = std::chrono::milliseconds(100);

}

YtDlpFetcher::YtDlpFetcher(config::FetcherConfig cfg) : cfg_(std::move(cfg)) {}

std::vector<std::string> YtDlpFetcher::buildArguments(
    const std::string& url,
    const FormatSpec& format,
    const std::filesystem::path& output_path) const {

  std::vector<std::string> args = {
    "-f", format.selector,
    "-o", output_path.string(),
    "--merge-output-format", format.container,
    "--retries", std::to_string(cfg_.retries),
    "--no-playlist",
    "--no-progress",
  };

  if (cfg_.no_check_certificates) {
    args.push_back("--no-check-certificates");
  }
  if (!cfg_.ffmpeg_location.empty()) {
    args.push_back("--ffmpeg-location");
    args.push_back(cfg_.ffmpeg_location);
  }

  args.push_back("--");
  args.push_back(url);
  return args;
}

std::string YtDlpFetcher::summarizeDiagnostics(const std::vector<std::string>& lines) {
  std::vector<std::string> picked;
  for (const auto& line : lines) {
    if (line.find("ERROR:") != std::string::npos) {
      picked.push_back(line);
    }
  }

  if (picked.empty()) {
    for (auto it = lines.rbegin(); it != lines.rend() && picked.size() < kMaxTailLines; ++it) {
      if (it->find_first_not_of(" \t\r") != std::string::npos) {
        picked.insert(picked.begin(), *it);
      }
    }
  }

  if (picked.empty()) {
    return "no diagnostic output";
  }

  std::string summary;
  for (const auto& line : picked) {
    if (!summary.empty()) summary += "\n";
    summary += line;
  }
  if (summary.size() > kMaxDiagnosticLength) {
    summary.resize(kMaxDiagnosticLength);
    summary += "...";
  }
  return summary;
}

std::expected<boost::filesystem::path, JobError> YtDlpFetcher::locateExecutable() const {
  boost::filesystem::path exe;
  if (cfg_.executable.find('/') != std::string::npos) {
    exe = cfg_.executable;
    boost::system::error_code ec;
    if (!boost::filesystem::exists(exe, ec)) {
      exe.clear();
    }
  } else {
    exe = bp::search_path(cfg_.executable);
  }

  if (exe.empty()) {
    return std::unexpected(JobError{ErrorKind::Fetch,
                                    "Retrieval tool not found: " + cfg_.executable});
  }
  return exe;
}

std::expected<void, JobError> YtDlpFetcher::fetch(
    const std::string& url,
    const FormatSpec& format,
    const std::filesystem::path& output_path,
    const JobContext& context,
    StartedCallback on_started) {

  auto exe = locateExecutable();
  if (!exe) {
    return std::unexpected(exe.error());
  }

  auto args = buildArguments(url, format, output_path);

  bp::ipstream err_stream;
  bp::group group;
  bp::child child;
  try {
    child = bp::child(*exe, bp::args(args),
                      bp::std_in < bp::null,
                      bp::std_out > bp::null,
                      bp::std_err > err_stream,
                      group);
  } catch (const bp::process_error& e) {
    return std::unexpected(JobError{ErrorKind::Fetch,
                                    "Failed to start " + cfg_.executable + ": " + e.what()});
  }

  if (on_started) {
    on_started();
  }

  // Drain stderr concurrently so a chatty child never blocks on a full pipe.
  std::mutex lines_mutex;
  std::deque<std::string> tail;
  std::vector<std::string> errors;
  std::thread reader([&]() {
    std::string line;
    while (std::getline(err_stream, line)) {
      std::lock_guard<std::mutex> lock(lines_mutex);
      if (line.find("ERROR:") != std::string::npos && errors.size() < kMaxKeptLines) {
        errors.push_back(line);
      }
      tail.push_back(std::move(line));
      if (tail.size() > kMaxKeptLines) {
        tail.pop_front();
      }
    }
  });

  bool interrupted = false;
  std::error_code ec;
  while (child.running(ec)) {
    if (context.cancelled()) {
      interrupted = true;
      std::error_code kill_ec;
      group.terminate(kill_ec);
      if (kill_ec) {
        std::cerr << "[fetch] failed to terminate " << cfg_.executable << ": "
                  << kill_ec.message() << std::endl;
      }
      break;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
  child.wait(ec);
  reader.join();

  if (interrupted) {
    return std::unexpected(context.interruption());
  }

  if (ec) {
    return std::unexpected(JobError{ErrorKind::Fetch,
                                    "Failed to wait for " + cfg_.executable + ": " + ec.message()});
  }

  int exit_code = child.exit_code();
  if (exit_code != 0) {
    std::vector<std::string> lines = errors;
    if (lines.empty()) {
      lines.assign(tail.begin(), tail.end());
    }
    return std::unexpected(JobError{
      ErrorKind::Fetch,
      cfg_.executable + " exited with code " + std::to_string(exit_code) + ": " +
        summarizeDiagnostics(lines)});
  }

  return {};
}

} // namespace clip_service
