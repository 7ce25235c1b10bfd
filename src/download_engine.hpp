#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "manifest.hpp"
#include "progress_tracker.hpp"

class HttpClient;

enum class VideoQuality { High, Low, Both };

std::optional<VideoQuality> parse_video_quality(const std::string& text);

struct DownloadScope {
  VideoQuality quality = VideoQuality::Both;
  bool images_only = false;
};

struct DownloadTask {
  std::string url;
  std::filesystem::path local_path;
  DownloadCategory category = DownloadCategory::VideoHigh;

  std::string id() const;
};

struct DownloadOutcome {
  DownloadTask task;
  bool success = false;
  uint64_t bytes_transferred = 0;
  std::size_t attempts = 0;
  std::string error;
};

struct FetchResult {
  bool success = false;
  bool retryable = false;
  int http_status = 0;
  std::string error;
};

// Streams one URL. on_length receives the content length once the response
// head is known (empty when absent); on_data returns false to abort.
using AssetFetcher = std::function<FetchResult(
  const std::string& url,
  const std::function<void(std::optional<uint64_t>)>& on_length,
  const std::function<bool(const char* data, std::size_t size)>& on_data)>;

AssetFetcher make_http_fetcher(std::shared_ptr<const HttpClient> client);

struct DownloadPlan {
  std::vector<DownloadTask> pending;
  std::vector<DownloadTask> skipped;
};

class DownloadEngine {
public:
  struct Options {
    std::filesystem::path downloads_root = "downloads";
    std::size_t max_concurrency = 4;
    std::size_t retry_attempts = 3;     // retries after the first attempt
    std::chrono::milliseconds retry_delay{2000};
    std::size_t chunk_size = 8192;
  };

  DownloadEngine(Options options,
                 AssetFetcher fetcher,
                 std::shared_ptr<ProgressTracker> progress = nullptr,
                 std::shared_ptr<Logger> logger = nullptr);

  std::vector<DownloadTask> expand(const AssetManifest& manifest, const DownloadScope& scope) const;
  // Splits tasks by whether their destination already exists. Run once, up front.
  DownloadPlan prefilter(std::vector<DownloadTask> tasks) const;

  DownloadStats download_all(const AssetManifest& manifest, const DownloadScope& scope);
  DownloadStats execute(const DownloadPlan& plan);

  // Stops handing out tasks; workers finish the file they are on.
  void request_stop() { stop_requested_ = true; }

  std::vector<DownloadOutcome> outcomes() const;
  const Options& options() const { return options_; }
  std::shared_ptr<ProgressTracker> progress() const { return progress_; }

private:
  DownloadOutcome run_task(const DownloadTask& task);
  bool attempt(const DownloadTask& task, DownloadOutcome& outcome, bool& retryable);
  void run_sequential(const std::vector<DownloadTask>& tasks);
  void run_parallel(const std::vector<DownloadTask>& tasks);
  void finish_task(DownloadOutcome outcome);

  Options options_;
  AssetFetcher fetcher_;
  std::shared_ptr<ProgressTracker> progress_;
  std::shared_ptr<Logger> logger_;
  std::atomic<bool> stop_requested_{false};
  mutable std::mutex outcomes_mutex_;
  std::vector<DownloadOutcome> outcomes_;
};
