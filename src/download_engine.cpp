#include "download_engine.hpp"

#include <algorithm>
#include <deque>
#include <fstream>
#include <set>
#include <thread>

#include "http_client.hpp"

namespace {

std::string task_filename(const DownloadTask& task) {
  return task.local_path.filename().string();
}

} // namespace

std::optional<VideoQuality> parse_video_quality(const std::string& text) {
  if(text == "high") return VideoQuality::High;
  if(text == "low") return VideoQuality::Low;
  if(text == "both") return VideoQuality::Both;
  return std::nullopt;
}

std::string DownloadTask::id() const {
  return std::string(download_category_label(category)) + ":" + task_filename(*this);
}

AssetFetcher make_http_fetcher(std::shared_ptr<const HttpClient> client) {
  return [client](const std::string& url,
                  const std::function<void(std::optional<uint64_t>)>& on_length,
                  const std::function<bool(const char*, std::size_t)>& on_data) {
    HttpRequest request;
    request.url = url;
    auto result = client->request(request,
      [&](const HttpResponseHead& head){
        if(on_length) on_length(head.content_length);
      },
      [&](const char* data, std::size_t size){
        return on_data ? on_data(data, size) : true;
      });
    FetchResult out;
    out.success = result.success;
    out.retryable = result.retryable;
    out.http_status = result.status;
    out.error = result.error;
    return out;
  };
}

DownloadEngine::DownloadEngine(Options options,
                               AssetFetcher fetcher,
                               std::shared_ptr<ProgressTracker> progress,
                               std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    fetcher_(std::move(fetcher)),
    progress_(progress ? std::move(progress) : std::make_shared<ProgressTracker>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("download")) {
  if(options_.max_concurrency == 0) options_.max_concurrency = 1;
  if(options_.chunk_size == 0) options_.chunk_size = 8192;
}

std::vector<DownloadTask> DownloadEngine::expand(const AssetManifest& manifest,
                                                 const DownloadScope& scope) const {
  const auto videos_dir = options_.downloads_root / "videos";
  const auto images_dir = options_.downloads_root / "images";
  const bool want_high = !scope.images_only && scope.quality != VideoQuality::Low;
  const bool want_low = !scope.images_only && scope.quality != VideoQuality::High;

  std::vector<DownloadTask> tasks;
  tasks.reserve(manifest.videos.size() * 3 + manifest.tags.size());
  for(const auto& video : manifest.videos) {
    if(want_high) {
      tasks.push_back(DownloadTask{video.high_res_url, videos_dir / video.high_res_key, DownloadCategory::VideoHigh});
    }
    if(want_low) {
      tasks.push_back(DownloadTask{video.low_res_url, videos_dir / video.low_res_key, DownloadCategory::VideoLow});
    }
    tasks.push_back(DownloadTask{video.thumbnail_url, images_dir / video.thumbnail_key, DownloadCategory::Thumbnail});
  }
  for(const auto& tag : manifest.tags) {
    if(!tag.image_url || tag.image_url->empty()) continue;
    auto filename = tag_image_filename(*tag.image_url);
    if(filename.empty()) continue;
    tasks.push_back(DownloadTask{*tag.image_url, images_dir / filename, DownloadCategory::TagImage});
  }
  return tasks;
}

DownloadPlan DownloadEngine::prefilter(std::vector<DownloadTask> tasks) const {
  DownloadPlan plan;
  std::set<std::filesystem::path> claimed;
  for(auto& task : tasks) {
    std::error_code ec;
    // a later task for an already claimed path would race on its .part file
    if(!claimed.insert(task.local_path).second ||
       std::filesystem::exists(task.local_path, ec)) {
      plan.skipped.push_back(std::move(task));
    } else {
      plan.pending.push_back(std::move(task));
    }
  }
  return plan;
}

DownloadStats DownloadEngine::download_all(const AssetManifest& manifest, const DownloadScope& scope) {
  auto tasks = expand(manifest, scope);
  auto plan = prefilter(std::move(tasks));
  logger_->info("{} files to download, {} skipped", plan.pending.size(), plan.skipped.size());
  return execute(plan);
}

DownloadStats DownloadEngine::execute(const DownloadPlan& plan) {
  {
    std::lock_guard lg(outcomes_mutex_);
    outcomes_.clear();
  }
  stop_requested_ = false;

  std::error_code ec;
  std::filesystem::create_directories(options_.downloads_root / "videos", ec);
  std::filesystem::create_directories(options_.downloads_root / "images", ec);

  progress_->begin_downloads(plan.pending.size(), plan.skipped.size());
  if(options_.max_concurrency <= 1 || plan.pending.size() <= 1) {
    run_sequential(plan.pending);
  } else {
    run_parallel(plan.pending);
  }

  auto stats = progress_->download_stats();
  if(stats.failed_downloads > 0) {
    logger_->warn("{} of {} downloads failed", stats.failed_downloads, stats.total_files);
  }
  return stats;
}

std::vector<DownloadOutcome> DownloadEngine::outcomes() const {
  std::lock_guard lg(outcomes_mutex_);
  return outcomes_;
}

void DownloadEngine::run_sequential(const std::vector<DownloadTask>& tasks) {
  for(const auto& task : tasks) {
    if(stop_requested_) break;
    finish_task(run_task(task));
  }
}

void DownloadEngine::run_parallel(const std::vector<DownloadTask>& tasks) {
  std::mutex job_mutex;
  std::deque<std::size_t> job_queue;
  for(std::size_t i = 0; i < tasks.size(); ++i) job_queue.push_back(i);

  auto take_job = [&]() -> std::optional<std::size_t> {
    std::lock_guard lg(job_mutex);
    if(stop_requested_ || job_queue.empty()) return std::nullopt;
    std::size_t job = job_queue.front();
    job_queue.pop_front();
    return job;
  };

  auto worker_fn = [&](){
    while(auto job = take_job()) {
      finish_task(run_task(tasks[*job]));
    }
  };

  const std::size_t worker_count = std::min(options_.max_concurrency, tasks.size());
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for(std::size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(worker_fn);
  }
  for(auto& thread : workers) {
    if(thread.joinable()) thread.join();
  }
}

DownloadOutcome DownloadEngine::run_task(const DownloadTask& task) {
  DownloadOutcome outcome;
  outcome.task = task;
  const std::size_t max_attempts = options_.retry_attempts + 1;
  for(std::size_t attempt_index = 0; attempt_index < max_attempts; ++attempt_index) {
    if(attempt_index > 0) {
      if(stop_requested_) break;
      logger_->debug("retrying {} ({}/{}) after: {}", task.id(), attempt_index, options_.retry_attempts, outcome.error);
      std::this_thread::sleep_for(options_.retry_delay);
    }
    bool retryable = false;
    ++outcome.attempts;
    if(attempt(task, outcome, retryable)) {
      outcome.success = true;
      outcome.error.clear();
      return outcome;
    }
    if(!retryable) break;
  }
  return outcome;
}

bool DownloadEngine::attempt(const DownloadTask& task, DownloadOutcome& outcome, bool& retryable) {
  auto staging = task.local_path;
  staging += ".part";

  std::ofstream file(staging, std::ios::binary | std::ios::trunc);
  if(!file) {
    outcome.error = "cannot open " + staging.string() + " for writing";
    retryable = false;
    return false;
  }

  const auto id = task.id();
  const std::size_t chunk = options_.chunk_size;
  std::optional<uint64_t> content_length;
  uint64_t written = 0;
  bool write_failed = false;

  auto result = fetcher_(task.url,
    [&](std::optional<uint64_t> length){ content_length = length; },
    [&](const char* data, std::size_t size){
      for(std::size_t offset = 0; offset < size; offset += chunk) {
        auto n = std::min(chunk, size - offset);
        file.write(data + offset, static_cast<std::streamsize>(n));
        if(!file) {
          write_failed = true;
          return false;
        }
        written += n;
        progress_->add_download_bytes(id, n, content_length);
      }
      return true;
    });
  file.close();

  std::error_code ec;
  if(result.success && !write_failed && !file.fail()) {
    std::filesystem::rename(staging, task.local_path, ec);
    if(!ec) {
      outcome.bytes_transferred = written;
      return true;
    }
    outcome.error = "cannot move download into place: " + ec.message();
    retryable = false;
  } else if(write_failed || file.fail()) {
    outcome.error = "write to " + staging.string() + " failed";
    retryable = false;
  } else {
    outcome.error = result.error.empty() ? "download failed" : result.error;
    retryable = result.retryable;
  }
  std::filesystem::remove(staging, ec);
  progress_->rewind_download_bytes(id, written);
  return false;
}

void DownloadEngine::finish_task(DownloadOutcome outcome) {
  if(outcome.success) {
    logger_->debug("downloaded {} ({} bytes)", outcome.task.id(), outcome.bytes_transferred);
  } else {
    logger_->warn("failed to download {} after {} attempt(s): {}",
                  outcome.task.url, outcome.attempts, outcome.error);
  }
  progress_->record_download(outcome.task.category, outcome.success, outcome.task.id());
  std::lock_guard lg(outcomes_mutex_);
  outcomes_.push_back(std::move(outcome));
}
