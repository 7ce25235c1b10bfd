#include "download_engine.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "manifest.hpp"
#include "onboard_app.hpp"
#include "progress_tracker.hpp"
#include "settings_manager.hpp"

#include "test_runner_utils.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace {

using onboard::test::TempWorkspace;
using onboard::test::TestCase;
using onboard::test::TestContext;
using onboard::test::read_file;
using onboard::test::write_file;
using onboard::test::write_json;

// Serves canned bodies per URL. A URL can fail a number of times before it
// succeeds, or fail forever.
class ScriptedServer {
public:
  struct Route {
    std::string body;
    int failures_before_success = 0;   // -1 fails every time
    bool retryable = true;
    int status = 503;
    bool send_length = true;
    std::size_t partial_bytes = 0;     // delivered before a failure
  };

  void serve(const std::string& url, std::string body) {
    std::lock_guard lg(mutex_);
    routes_[url].body = std::move(body);
  }

  Route& route(const std::string& url) {
    std::lock_guard lg(mutex_);
    return routes_[url];
  }

  std::size_t calls(const std::string& url) const {
    std::lock_guard lg(mutex_);
    auto it = calls_.find(url);
    return it == calls_.end() ? 0 : it->second;
  }

  std::size_t total_calls() const {
    std::lock_guard lg(mutex_);
    std::size_t total = 0;
    for(const auto& entry : calls_) total += entry.second;
    return total;
  }

  AssetFetcher fetcher() {
    return [this](const std::string& url,
                  const std::function<void(std::optional<uint64_t>)>& on_length,
                  const std::function<bool(const char*, std::size_t)>& on_data) {
      Route route;
      std::size_t call = 0;
      {
        std::lock_guard lg(mutex_);
        auto it = routes_.find(url);
        call = ++calls_[url];
        if(it == routes_.end()) {
          FetchResult missing;
          missing.http_status = 404;
          missing.error = "HTTP 404";
          return missing;
        }
        route = it->second;
      }
      FetchResult result;
      const bool fail = route.failures_before_success < 0 ||
                        static_cast<int>(call) <= route.failures_before_success;
      if(fail) {
        if(route.partial_bytes > 0) {
          on_length(route.body.size());
          on_data(route.body.data(), std::min(route.partial_bytes, route.body.size()));
        }
        result.retryable = route.retryable;
        result.http_status = route.status;
        result.error = "HTTP " + std::to_string(route.status);
        return result;
      }
      on_length(route.send_length ? std::optional<uint64_t>(route.body.size()) : std::nullopt);
      // two writes so chunking is exercised
      auto half = route.body.size() / 2;
      if(!on_data(route.body.data(), half) ||
         !on_data(route.body.data() + half, route.body.size() - half)) {
        result.error = "aborted";
        return result;
      }
      result.success = true;
      result.http_status = 200;
      return result;
    };
  }

private:
  mutable std::mutex mutex_;
  std::map<std::string, Route> routes_;
  std::map<std::string, std::size_t> calls_;
};

const std::string kCdn = "https://cdn.example.com/";

nlohmann::json video_json(const std::string& id) {
  return nlohmann::json{
    {"id", id},
    {"title", "Film " + id},
    {"fileKey", "highres_" + id + ".mp4"},
    {"fileUrl", kCdn + "highres_" + id + ".mp4"},
    {"fileKeyLow", "lowres_" + id + ".mp4"},
    {"fileUrlLow", kCdn + "lowres_" + id + ".mp4"},
    {"thumbnailKey", "thumb_" + id + ".jpg"},
    {"thumbnailUrl", kCdn + "thumb_" + id + ".jpg"},
    {"tags", nlohmann::json::array({"nature"})}};
}

// Two videos, one tag with an image, one without.
nlohmann::json sample_manifest_json() {
  return nlohmann::json{
    {"lastModified", "01/02/2025 10:00:00"},
    {"videos", nlohmann::json::array({video_json("1"), video_json("2")})},
    {"tags", nlohmann::json::array({
      nlohmann::json{{"id", "t1"}, {"name", "Nature"}, {"imageUrl", kCdn + "tags/nature.png?v=3"}},
      nlohmann::json{{"id", "t2"}, {"name", "City"}}})}};
}

void serve_everything(ScriptedServer& server) {
  for(const std::string id : {"1", "2"}) {
    server.serve(kCdn + "highres_" + id + ".mp4", std::string(40, 'H'));
    server.serve(kCdn + "lowres_" + id + ".mp4", std::string(20, 'L'));
    server.serve(kCdn + "thumb_" + id + ".jpg", std::string(6, 'T'));
  }
  server.serve(kCdn + "tags/nature.png?v=3", std::string(4, 'N'));
}

DownloadEngine::Options engine_options(const std::filesystem::path& root, std::size_t concurrency = 4) {
  DownloadEngine::Options options;
  options.downloads_root = root;
  options.max_concurrency = concurrency;
  options.retry_attempts = 2;
  options.retry_delay = std::chrono::milliseconds(0);
  options.chunk_size = 8;
  return options;
}

bool no_staging_files(const std::filesystem::path& root) {
  std::error_code ec;
  for(std::filesystem::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    if(it->path().extension() == ".part") return false;
  }
  return true;
}

bool test_expansion_counts_per_scope(TestContext& ctx) {
  TempWorkspace ws("expand");
  ScriptedServer server;
  DownloadEngine engine(engine_options(ws.root()), server.fetcher(), nullptr, ctx.logger("download"));
  auto manifest = parse_manifest(sample_manifest_json());
  auto count = [&](VideoQuality quality, bool images_only) {
    return engine.expand(manifest, DownloadScope{quality, images_only}).size();
  };
  auto tasks = engine.expand(manifest, DownloadScope{});
  bool tag_path = std::any_of(tasks.begin(), tasks.end(), [&](const DownloadTask& t){
    return t.category == DownloadCategory::TagImage && t.local_path == ws.root() / "images" / "nature.png";
  });
  return count(VideoQuality::Both, false) == 7 &&
         count(VideoQuality::High, false) == 5 &&
         count(VideoQuality::Low, false) == 5 &&
         count(VideoQuality::Both, true) == 3 &&
         tag_path;
}

bool test_full_download_of_two_videos_and_a_tag(TestContext& ctx) {
  TempWorkspace ws("full");
  ScriptedServer server;
  serve_everything(server);
  DownloadEngine engine(engine_options(ws.root()), server.fetcher(), nullptr, ctx.logger("download"));
  auto stats = engine.download_all(parse_manifest(sample_manifest_json()), DownloadScope{});

  DownloadStats expected;
  expected.videos_high = 2;
  expected.videos_low = 2;
  expected.thumbnails = 2;
  expected.tag_images = 1;
  expected.total_files = 7;
  expected.completed = 7;
  expected.bytes_downloaded = 2 * 40 + 2 * 20 + 2 * 6 + 4;
  return stats == expected &&
         read_file(ws / "videos/highres_1.mp4") == std::string(40, 'H') &&
         read_file(ws / "images/nature.png") == std::string(4, 'N') &&
         no_staging_files(ws.root()) &&
         engine.outcomes().size() == 7;
}

bool test_permanent_high_res_failure_is_isolated(TestContext& ctx) {
  TempWorkspace ws("permanent");
  ScriptedServer server;
  serve_everything(server);
  server.route(kCdn + "highres_1.mp4").failures_before_success = -1;
  DownloadEngine engine(engine_options(ws.root()), server.fetcher(), nullptr, ctx.logger("download"));
  auto manifest = parse_manifest(nlohmann::json{
    {"lastModified", "x"},
    {"videos", nlohmann::json::array({video_json("1")})},
    {"tags", nlohmann::json::array()}});
  auto stats = engine.download_all(manifest, DownloadScope{});
  auto outcomes = engine.outcomes();
  auto failed = std::find_if(outcomes.begin(), outcomes.end(),
                             [](const DownloadOutcome& o){ return !o.success; });
  return stats.failed_downloads == 1 &&
         stats.videos_low == 1 &&
         stats.thumbnails == 1 &&
         stats.videos_high == 0 &&
         stats.completed == 3 &&
         failed != outcomes.end() &&
         failed->attempts == 3 &&
         server.calls(kCdn + "highres_1.mp4") == 3 &&
         !std::filesystem::exists(ws / "videos/highres_1.mp4") &&
         no_staging_files(ws.root());
}

bool test_existing_files_skipped_up_front(TestContext& ctx) {
  TempWorkspace ws("prefilter");
  ScriptedServer server;
  serve_everything(server);
  write_file(ws / "videos/lowres_2.mp4", "already here");
  DownloadEngine engine(engine_options(ws.root()), server.fetcher(), nullptr, ctx.logger("download"));
  auto stats = engine.download_all(parse_manifest(sample_manifest_json()), DownloadScope{});
  return stats.skipped_files == 1 &&
         stats.total_files == 6 &&
         stats.completed == 6 &&
         stats.videos_low == 1 &&
         server.calls(kCdn + "lowres_2.mp4") == 0 &&
         read_file(ws / "videos/lowres_2.mp4") == "already here";
}

bool test_transient_failures_retried(TestContext& ctx) {
  TempWorkspace ws("transient");
  ScriptedServer server;
  server.serve(kCdn + "thumb_9.jpg", "thumbnail");
  server.route(kCdn + "thumb_9.jpg").failures_before_success = 2;
  DownloadEngine engine(engine_options(ws.root(), 1), server.fetcher(), nullptr, ctx.logger("download"));
  DownloadPlan plan;
  plan.pending.push_back(DownloadTask{kCdn + "thumb_9.jpg", ws / "images/thumb_9.jpg", DownloadCategory::Thumbnail});
  auto stats = engine.execute(plan);
  auto outcomes = engine.outcomes();
  return stats.thumbnails == 1 &&
         stats.failed_downloads == 0 &&
         outcomes.size() == 1 &&
         outcomes.front().attempts == 3 &&
         read_file(ws / "images/thumb_9.jpg") == "thumbnail";
}

bool test_not_found_is_not_retried(TestContext& ctx) {
  TempWorkspace ws("notfound");
  ScriptedServer server;
  DownloadEngine engine(engine_options(ws.root(), 1), server.fetcher(), nullptr, ctx.logger("download"));
  DownloadPlan plan;
  plan.pending.push_back(DownloadTask{kCdn + "gone.mp4", ws / "videos/gone.mp4", DownloadCategory::VideoHigh});
  auto stats = engine.execute(plan);
  return stats.failed_downloads == 1 &&
         server.calls(kCdn + "gone.mp4") == 1 &&
         engine.outcomes().front().attempts == 1;
}

bool test_failed_attempt_rewinds_bytes(TestContext& ctx) {
  TempWorkspace ws("rewind");
  ScriptedServer server;
  server.serve(kCdn + "big.mp4", std::string(64, 'B'));
  auto& route = server.route(kCdn + "big.mp4");
  route.failures_before_success = -1;
  route.retryable = false;
  route.status = 500;
  route.partial_bytes = 30;
  DownloadEngine engine(engine_options(ws.root(), 1), server.fetcher(), nullptr, ctx.logger("download"));
  DownloadPlan plan;
  plan.pending.push_back(DownloadTask{kCdn + "big.mp4", ws / "videos/big.mp4", DownloadCategory::VideoHigh});
  auto stats = engine.execute(plan);
  return stats.failed_downloads == 1 &&
         stats.bytes_downloaded == 0 &&
         no_staging_files(ws.root());
}

bool test_retry_restarts_per_file_progress(TestContext& ctx) {
  TempWorkspace ws("retryprogress");
  ScriptedServer server;
  server.serve(kCdn + "big.mp4", std::string(64, 'B'));
  auto& route = server.route(kCdn + "big.mp4");
  route.failures_before_success = 1;
  route.partial_bytes = 30;
  auto progress = std::make_shared<ProgressTracker>();
  std::vector<ProgressEvent> events;
  progress->set_listener([&](const ProgressEvent& event) {
    if(event.status == "downloading" && event.id != "downloads") events.push_back(event);
  });
  DownloadEngine engine(engine_options(ws.root(), 1), server.fetcher(), progress, ctx.logger("download"));
  DownloadPlan plan;
  plan.pending.push_back(DownloadTask{kCdn + "big.mp4", ws / "videos/big.mp4", DownloadCategory::VideoHigh});
  auto stats = engine.execute(plan);

  bool within_length = !events.empty();
  uint64_t last = 0;
  for(const auto& event : events) {
    auto percent = percent_complete(event.current, event.total);
    within_length = within_length && event.total && event.current <= *event.total &&
                    percent && *percent <= 100.0;
    last = event.current;
  }
  return stats.videos_high == 1 &&
         stats.bytes_downloaded == 64 &&
         engine.outcomes().front().attempts == 2 &&
         within_length &&
         last == 64;
}

bool test_shared_local_path_downloaded_once(TestContext& ctx) {
  TempWorkspace ws("sharedpath");
  ScriptedServer server;
  server.serve("https://a.example.com/tag.png", std::string(100, 'A'));
  server.serve("https://b.example.com/tag.png", std::string(10, 'B'));
  auto manifest = parse_manifest(nlohmann::json{
    {"lastModified", "01/02/2025 10:00:00"},
    {"videos", nlohmann::json::array()},
    {"tags", nlohmann::json::array({
      nlohmann::json{{"id", "t1"}, {"name", "One"}, {"imageUrl", "https://a.example.com/tag.png"}},
      nlohmann::json{{"id", "t2"}, {"name", "Two"}, {"imageUrl", "https://b.example.com/tag.png"}}})}});
  DownloadEngine engine(engine_options(ws.root(), 4), server.fetcher(), nullptr, ctx.logger("download"));
  if(engine.expand(manifest, DownloadScope{}).size() != 2) return false;

  bool stable = true;
  for(int run = 0; run < 3 && stable; ++run) {
    std::filesystem::remove(ws / "images/tag.png");
    auto stats = engine.download_all(manifest, DownloadScope{});
    stable = stats.tag_images == 1 &&
             stats.failed_downloads == 0 &&
             stats.skipped_files == 1 &&
             stats.total_files == 1 &&
             read_file(ws / "images/tag.png") == std::string(100, 'A') &&
             no_staging_files(ws.root());
  }
  return stable && server.calls("https://b.example.com/tag.png") == 0;
}

bool test_sequential_and_parallel_agree(TestContext& ctx) {
  TempWorkspace sequential_ws("sequential");
  TempWorkspace parallel_ws("parallel");
  auto run = [&](const TempWorkspace& ws, std::size_t concurrency) {
    ScriptedServer server;
    serve_everything(server);
    server.route(kCdn + "lowres_1.mp4").failures_before_success = -1;
    server.route(kCdn + "thumb_2.jpg").failures_before_success = 1;
    DownloadEngine engine(engine_options(ws.root(), concurrency), server.fetcher(), nullptr,
                          ctx.logger("download"));
    return engine.download_all(parse_manifest(sample_manifest_json()), DownloadScope{});
  };
  auto sequential = run(sequential_ws, 1);
  auto parallel = run(parallel_ws, 4);
  return sequential == parallel &&
         sequential.failed_downloads == 1 &&
         sequential.thumbnails == 2 &&
         sequential.completed == sequential.total_files;
}

bool test_progress_events_follow_content_length(TestContext& ctx) {
  TempWorkspace ws("events");
  ScriptedServer server;
  server.serve(kCdn + "a.jpg", std::string(10, 'a'));
  server.serve(kCdn + "b.jpg", std::string(10, 'b'));
  server.route(kCdn + "b.jpg").send_length = false;
  auto progress = std::make_shared<ProgressTracker>();
  std::mutex events_mutex;
  std::vector<ProgressEvent> events;
  progress->set_listener([&](const ProgressEvent& event) {
    std::lock_guard lg(events_mutex);
    events.push_back(event);
  });
  DownloadEngine engine(engine_options(ws.root(), 1), server.fetcher(), progress, ctx.logger("download"));
  DownloadPlan plan;
  plan.pending.push_back(DownloadTask{kCdn + "a.jpg", ws / "images/a.jpg", DownloadCategory::Thumbnail});
  plan.pending.push_back(DownloadTask{kCdn + "b.jpg", ws / "images/b.jpg", DownloadCategory::Thumbnail});
  engine.execute(plan);

  bool a_known = false;
  bool b_unknown = false;
  bool finished = false;
  for(const auto& event : events) {
    if(event.id == "thumbnail:a.jpg" && event.status == "downloading") {
      a_known = event.total == std::optional<uint64_t>(10) && percent_complete(event.current, event.total).has_value();
    }
    if(event.id == "thumbnail:b.jpg" && event.status == "downloading") {
      b_unknown = !event.total.has_value() && !percent_complete(event.current, event.total).has_value();
    }
    if(event.id == "downloads" && event.status == "completed") {
      finished = event.current == 2;
    }
  }
  return a_known && b_unknown && finished &&
         percent_complete(5, 10) == std::optional<double>(50.0) &&
         !percent_complete(5, 0).has_value();
}

bool test_stop_request_leaves_remaining_tasks(TestContext& ctx) {
  TempWorkspace ws("stop");
  ScriptedServer server;
  serve_everything(server);
  DownloadEngine* engine_ptr = nullptr;
  auto inner = server.fetcher();
  AssetFetcher stopping = [&](const std::string& url,
                              const std::function<void(std::optional<uint64_t>)>& on_length,
                              const std::function<bool(const char*, std::size_t)>& on_data) {
    engine_ptr->request_stop();
    return inner(url, on_length, on_data);
  };
  DownloadEngine engine(engine_options(ws.root(), 1), stopping, nullptr, ctx.logger("download"));
  engine_ptr = &engine;
  auto stats = engine.download_all(parse_manifest(sample_manifest_json()), DownloadScope{});
  return stats.completed == 1 && stats.total_files == 7 && server.total_calls() == 1;
}

bool test_invalid_manifest_rejected(TestContext&) {
  auto doc = sample_manifest_json();
  doc["videos"][1].erase("fileUrl");
  bool missing_url = false;
  try {
    parse_manifest(doc);
  } catch(const OnboardError& e) {
    missing_url = e.kind() == ErrorKind::ManifestInvalid;
  }

  auto escaping = sample_manifest_json();
  escaping["videos"][0]["thumbnailKey"] = "../../etc/passwd";
  bool escape_rejected = false;
  try {
    parse_manifest(escaping);
  } catch(const OnboardError& e) {
    escape_rejected = e.kind() == ErrorKind::ManifestInvalid;
  }

  bool not_object = false;
  try {
    parse_manifest(nlohmann::json::array());
  } catch(const OnboardError& e) {
    not_object = e.kind() == ErrorKind::ManifestInvalid;
  }
  return missing_url && escape_rejected && not_object;
}

std::shared_ptr<SettingsManager> download_settings(const TempWorkspace& ws) {
  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(ws / "config.json");
  std::string error;
  settings->set_from_string("downloads_root", ws.root().string(), error);
  settings->set_from_string("retry_delay_ms", "0", error);
  settings->set_from_string("retry_attempts", "1", error);
  return settings;
}

bool test_download_command_exit_status(TestContext& ctx) {
  TempWorkspace ws("command");
  write_json(ws / "new_data.json", sample_manifest_json());
  ScriptedServer server;
  serve_everything(server);
  OnboardApp::Options options;
  options.fetcher = server.fetcher();
  OnboardApp app(download_settings(ws), options);
  ctx.logs.attach(app.logger(), "app");
  int first = app.run_command("download");
  bool counted = app.download_stats() && app.download_stats()->completed == 7;

  std::filesystem::remove(ws / "videos/highres_2.mp4");
  server.route(kCdn + "highres_2.mp4").failures_before_success = -1;
  int second = app.run_command("download");
  bool partial = app.download_stats() &&
                 app.download_stats()->failed_downloads == 1 &&
                 app.download_stats()->skipped_files == 6;
  return first == 0 && counted && second == 1 && partial;
}

bool test_download_command_quality_and_bad_manifest(TestContext& ctx) {
  TempWorkspace ws("quality");
  write_json(ws / "new_data.json", sample_manifest_json());
  ScriptedServer server;
  serve_everything(server);
  auto settings = download_settings(ws);
  std::string error;
  settings->set_from_string("quality", "low", error);
  settings->set_from_string("command", "download", error);
  OnboardApp::Options options;
  options.fetcher = server.fetcher();
  OnboardApp app(settings, options);
  ctx.logs.attach(app.logger(), "app");
  int low = app.run();
  bool low_only = app.download_stats() &&
                  app.download_stats()->videos_high == 0 &&
                  app.download_stats()->videos_low == 2;

  write_file(ws / "new_data.json", "{ not json");
  int broken = app.run();

  std::filesystem::remove(ws / "new_data.json");
  int missing = app.run_command("download");
  return low == 0 && low_only && broken == 1 && ctx.logs.contains("manifest_invalid") && missing == 1;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"expansion_counts_per_scope", test_expansion_counts_per_scope},
    {"full_download_of_two_videos_and_a_tag", test_full_download_of_two_videos_and_a_tag},
    {"permanent_high_res_failure_is_isolated", test_permanent_high_res_failure_is_isolated},
    {"existing_files_skipped_up_front", test_existing_files_skipped_up_front},
    {"transient_failures_retried", test_transient_failures_retried},
    {"not_found_is_not_retried", test_not_found_is_not_retried},
    {"failed_attempt_rewinds_bytes", test_failed_attempt_rewinds_bytes},
    {"retry_restarts_per_file_progress", test_retry_restarts_per_file_progress},
    {"shared_local_path_downloaded_once", test_shared_local_path_downloaded_once},
    {"sequential_and_parallel_agree", test_sequential_and_parallel_agree},
    {"progress_events_follow_content_length", test_progress_events_follow_content_length},
    {"stop_request_leaves_remaining_tasks", test_stop_request_leaves_remaining_tasks},
    {"invalid_manifest_rejected", test_invalid_manifest_rejected},
    {"download_command_exit_status", test_download_command_exit_status},
    {"download_command_quality_and_bad_manifest", test_download_command_quality_and_bad_manifest},
  };
  return onboard::test::run_test_cases("download", tests, argc, argv);
}
