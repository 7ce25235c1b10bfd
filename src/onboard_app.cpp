#include "onboard_app.hpp"

#include <algorithm>
#include <functional>
#include <unordered_map>

#include "adb_bridge.hpp"
#include "content_client.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "local_file_set.hpp"
#include "manifest.hpp"
#include "settings_manager.hpp"

OnboardApp::OnboardApp(std::shared_ptr<SettingsManager> settings, Options options)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    options_(std::move(options)),
    logger_(std::make_shared<Logger>("onboard")),
    progress_(std::make_shared<ProgressTracker>()) {
  if(!options_.root_cache) {
    options_.root_cache = RootAccessCache::shared();
  }
}

const std::vector<std::string>& OnboardApp::commands() {
  static const std::vector<std::string> names = {
    "list-devices", "verify", "fetch-data", "download", "transfer", "deploy", "settings"
  };
  return names;
}

int OnboardApp::run() {
  auto command = SettingsManager::trim_copy(settings_->get<std::string>("command"));
  if(command.empty()) {
    logger_->print_err("No command given; try --help");
    return 1;
  }
  try {
    return run_command(command);
  } catch(const OnboardError& e) {
    logger_->error("{} aborted: {} [{}]", command, e.what(), error_kind_label(e.kind()));
    if(!transfer_results_.empty()) print_transfer_summary();
    return 1;
  }
}

int OnboardApp::run_command(const std::string& command) {
  std::string name = SettingsManager::to_lower(command);
  std::replace(name.begin(), name.end(), '_', '-');

  const bool needs_login = name == "fetch-data" ||
                           (name == "deploy" && !settings_->get<bool>("skip_fetch"));
  auto issues = validate_settings(*settings_, needs_login);
  if(name != "settings" && !issues.empty()) {
    for(const auto& issue : issues) logger_->print_err("Configuration: {}", issue);
    return 1;
  }

  static const std::unordered_map<std::string, std::function<int(OnboardApp&)>> handlers = {
    {"list-devices", [](OnboardApp& app){ return app.list_devices(); }},
    {"devices",      [](OnboardApp& app){ return app.list_devices(); }},
    {"verify",       [](OnboardApp& app){ return app.verify(); }},
    {"fetch-data",   [](OnboardApp& app){ return app.fetch_data(); }},
    {"download",     [](OnboardApp& app){ return app.download(); }},
    {"transfer",     [](OnboardApp& app){ return app.transfer(); }},
    {"deploy",       [](OnboardApp& app){ return app.deploy(); }},
    {"settings",     [](OnboardApp& app){ return app.show_settings(); }},
  };
  auto it = handlers.find(name);
  if(it == handlers.end()) {
    logger_->print_err("Unknown command '{}'", command);
    return 1;
  }
  return it->second(*this);
}

std::shared_ptr<DeviceBridge> OnboardApp::bridge() {
  if(!options_.bridge) {
    AdbBridge::Options adb;
    adb.host = settings_->get<std::string>("adb_host");
    adb.port = static_cast<uint16_t>(settings_->get<int>("adb_port"));
    adb.command_timeout = std::chrono::milliseconds(settings_->get<int>("bridge_timeout_ms"));
    adb.push_timeout = std::chrono::milliseconds(settings_->get<int>("push_timeout_ms"));
    options_.bridge = std::make_shared<AdbBridge>(adb, std::make_shared<Logger>("adb"));
  }
  return options_.bridge;
}

std::shared_ptr<const HttpClient> OnboardApp::http_client() {
  if(!http_) {
    HttpClient::Options http;
    http.timeout = std::chrono::seconds(settings_->get<int>("http_timeout"));
    http_ = std::make_shared<HttpClient>(http, std::make_shared<Logger>("http"));
  }
  return http_;
}

std::shared_ptr<ConflictResolver> OnboardApp::conflict_resolver() {
  if(!options_.conflicts) {
    auto policy = settings_->get<std::string>("conflict_policy");
    if(auto fixed = parse_conflict_policy(policy)) {
      options_.conflicts = std::make_shared<FixedConflictPolicy>(*fixed);
    } else {
      options_.conflicts = std::make_shared<InteractiveConflictPrompt>();
    }
  }
  return options_.conflicts;
}

std::filesystem::path OnboardApp::downloads_root() const {
  return settings_->get<std::string>("downloads_root");
}

StorageResolver::Options OnboardApp::storage_options() const {
  StorageResolver::Options storage;
  storage.primary_path = settings_->get<std::string>("device_path");
  storage.fallback_paths = settings_->get<std::vector<std::string>>("fallback_paths");
  storage.allow_root = settings_->get<bool>("allow_root");
  storage.probe_timeout = std::chrono::milliseconds(settings_->get<int>("bridge_timeout_ms"));
  return storage;
}

std::vector<std::string> OnboardApp::search_paths() const {
  auto storage = storage_options();
  std::vector<std::string> paths{storage.primary_path};
  paths.insert(paths.end(), storage.fallback_paths.begin(), storage.fallback_paths.end());
  return paths;
}

bool OnboardApp::require_online(const std::vector<DeviceInfo>& devices, const std::string& serial) const {
  auto it = std::find_if(devices.begin(), devices.end(),
                         [&](const DeviceInfo& d){ return d.serial == serial; });
  if(it == devices.end()) {
    logger_->error("Device {} is not connected", serial);
    return false;
  }
  if(!it->online()) {
    logger_->error("Device {} is {}", serial, it->status);
    return false;
  }
  return true;
}

bool OnboardApp::select_targets(bool auto_detect, std::vector<DeviceTarget>& targets) {
  targets.clear();
  auto devices = bridge()->list_devices();
  auto master = settings_->get<std::string>("master_serial");
  auto slave = settings_->get<std::string>("slave_serial");

  if(auto_detect) {
    std::vector<std::string> online;
    for(const auto& device : devices) {
      if(device.online()) online.push_back(device.serial);
    }
    if(online.empty()) {
      logger_->error("No online devices to pick from");
      return false;
    }
    master = online[0];
    slave = online.size() > 1 ? online[1] : std::string();
    std::string error;
    if(!settings_->set_from_string("master_serial", master, error) ||
       !settings_->set_from_string("slave_serial", slave, error)) {
      logger_->error("Cannot record detected devices: {}", error);
      return false;
    }
    logger_->info("Auto-detected master {}{}", master, slave.empty() ? "" : ", slave " + slave);
  }

  const bool master_only = settings_->get<bool>("master_only");
  const bool slave_only = settings_->get<bool>("slave_only");
  if(master_only && slave_only) {
    logger_->print_err("--master_only and --slave_only exclude each other");
    return false;
  }
  if(!slave_only && !master.empty()) {
    targets.emplace_back(master, DeviceRole::Master, settings_->get<std::string>("device_path"));
  }
  if(!master_only && !slave.empty()) {
    targets.emplace_back(slave, DeviceRole::Slave, settings_->get<std::string>("device_path"));
  }
  if(targets.empty()) {
    logger_->print_err("No devices selected; set --master_serial/--slave_serial or use --auto");
    return false;
  }
  for(const auto& target : targets) {
    if(!require_online(devices, target.serial)) return false;
  }
  return true;
}

int OnboardApp::list_devices() {
  auto devices = bridge()->list_devices();
  if(devices.empty()) {
    logger_->print("No devices connected");
    return 0;
  }
  logger_->print("{:<24} {:<14} {:<20} {}", "Serial", "Status", "Model", "Product");
  for(const auto& device : devices) {
    logger_->print("{:<24} {:<14} {:<20} {}", device.serial, device.status, device.model, device.product);
  }
  return 0;
}

int OnboardApp::verify() {
  auto serial = settings_->get<std::string>("device");
  if(!serial.empty()) return verify_device(serial);
  if(settings_->get<bool>("deployment")) return verify_deployment();
  logger_->print_err("verify needs --device <serial> or --deployment");
  return 1;
}

int OnboardApp::verify_device(const std::string& serial) {
  if(!require_online(bridge()->list_devices(), serial)) return 1;

  auto role = serial == settings_->get<std::string>("slave_serial") ? DeviceRole::Slave : DeviceRole::Master;
  DeviceTarget target(serial, role, settings_->get<std::string>("device_path"));
  StorageResolver resolver(bridge(), storage_options(), options_.root_cache);
  auto storage = resolver.resolve(target);
  if(!storage.success) {
    logger_->error("{}: {}", serial, storage.detail);
    return 1;
  }
  for(const auto& path : {target.base_path, target.video_path, target.image_path}) {
    if(!bridge()->make_dirs(serial, path)) {
      logger_->error("{}: cannot create {}", serial, path);
      return 1;
    }
  }

  DeploymentVerifier::Options verify_options;
  verify_options.search_paths = search_paths();
  DeploymentVerifier verifier(bridge(), verify_options);
  if(!verifier.write_probe(target)) {
    logger_->error("{}: no write permission in {}", serial, target.base_path);
    return 1;
  }
  logger_->print("{} ({}): {} is writable [{}]", serial, device_role_label(role),
                 target.base_path, storage_source_label(storage.source));
  if(auto info = verifier.storage_info(target)) {
    logger_->print("  used {}, total {}, available {}", info->used_space.empty() ? "?" : info->used_space,
                   info->total_space.empty() ? "?" : info->total_space,
                   info->available_space.empty() ? "?" : info->available_space);
  }
  logger_->print("Device verification successful");
  return 0;
}

int OnboardApp::verify_deployment() {
  std::vector<DeviceTarget> targets;
  auto master = settings_->get<std::string>("master_serial");
  auto slave = settings_->get<std::string>("slave_serial");
  if(!master.empty()) targets.emplace_back(master, DeviceRole::Master, "");
  if(!slave.empty()) targets.emplace_back(slave, DeviceRole::Slave, "");
  if(targets.empty()) {
    logger_->print_err("No devices configured for verification");
    return 1;
  }

  auto devices = bridge()->list_devices();
  DeploymentVerifier::Options verify_options;
  verify_options.search_paths = search_paths();
  DeploymentVerifier verifier(bridge(), verify_options);
  bool all_verified = true;
  for(auto& target : targets) {
    if(!require_online(devices, target.serial)) {
      all_verified = false;
      continue;
    }
    auto report = verifier.inspect(target);
    logger_->print("{} device {}:", device_role_label(target.role), target.serial);
    logger_->print("  Location:    {}", report.base_path.empty() ? "not found" : report.base_path);
    logger_->print("  JSON file:   {}", report.json_exists ? "present" : "missing");
    if(target.role == DeviceRole::Master) {
      logger_->print("  Credential:  {}", report.credential_exists ? "present" : "missing");
    }
    logger_->print("  Video files: {}", report.video_count);
    logger_->print("  Image files: {}", report.image_count);
    if(report.storage && !report.storage->used_space.empty()) {
      logger_->print("  Storage used: {}", report.storage->used_space);
    }
    if(!report.verified()) all_verified = false;
  }
  return all_verified ? 0 : 1;
}

int OnboardApp::fetch_data() {
  auto password = settings_->get<std::string>("password");
  if(password.empty()) {
    logger_->print_err("A password is required to log in (--password)");
    return 1;
  }
  ContentClient::Options content;
  content.api_url = settings_->get<std::string>("api_url");
  content.auth_endpoint = settings_->get<std::string>("auth_endpoint");
  content.tags_endpoint = settings_->get<std::string>("tags_endpoint");
  content.films_endpoint = settings_->get<std::string>("films_endpoint");
  ContentClient client(http_client(), content);
  if(!client.authenticate(settings_->get<std::string>("email"), password)) return 1;
  return client.write_manifest(downloads_root()) ? 0 : 1;
}

int OnboardApp::download() {
  auto path = downloads_root() / kManifestFileName;
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) {
    logger_->print_err("{} not found; run fetch-data first", path.string());
    return 1;
  }
  auto manifest = load_manifest(path);

  DownloadScope scope;
  scope.quality = parse_video_quality(settings_->get<std::string>("quality")).value_or(VideoQuality::Both);
  scope.images_only = settings_->get<bool>("images_only");

  DownloadEngine::Options engine_options;
  engine_options.downloads_root = downloads_root();
  engine_options.max_concurrency = static_cast<std::size_t>(settings_->get<int>("max_concurrent_downloads"));
  engine_options.retry_attempts = static_cast<std::size_t>(settings_->get<int>("retry_attempts"));
  engine_options.retry_delay = std::chrono::milliseconds(settings_->get<int>("retry_delay_ms"));

  AssetFetcher fetcher = options_.fetcher ? options_.fetcher : make_http_fetcher(http_client());
  DownloadEngine engine(engine_options, fetcher, progress_, std::make_shared<Logger>("download"));
  logger_->info("Downloading assets for {} videos and {} tags", manifest.videos.size(), manifest.tags.size());
  auto stats = engine.download_all(manifest, scope);
  download_stats_ = stats;
  print_download_stats(stats);
  return stats.failed_downloads == 0 ? 0 : 1;
}

void OnboardApp::print_download_stats(const DownloadStats& stats) const {
  logger_->print("Download completed: {}/{} files, {} skipped, {} bytes",
                 stats.completed, stats.total_files, stats.skipped_files, stats.bytes_downloaded);
  logger_->print("  High-res videos: {}", stats.videos_high);
  logger_->print("  Low-res videos:  {}", stats.videos_low);
  logger_->print("  Thumbnails:      {}", stats.thumbnails);
  logger_->print("  Tag images:      {}", stats.tag_images);
  if(stats.failed_downloads > 0) {
    logger_->print_err("  Failed downloads: {}", stats.failed_downloads);
  }
}

int OnboardApp::transfer() {
  transfer_results_.clear();
  TransferScope scope;
  scope.videos_only = settings_->get<bool>("videos_only");
  scope.json_only = settings_->get<bool>("json_only");
  scope.clean_remote = settings_->get<bool>("clean_remote");
  if(scope.videos_only && scope.json_only) {
    logger_->print_err("--videos_only and --json_only exclude each other");
    return 1;
  }

  std::vector<DeviceTarget> targets;
  if(!select_targets(settings_->get<bool>("auto"), targets)) return 1;

  auto resolver = std::make_shared<StorageResolver>(bridge(), storage_options(), options_.root_cache,
                                                    std::make_shared<Logger>("storage"));
  TransferEngine::Options engine_options;
  engine_options.downloads_root = downloads_root();
  TransferEngine engine(bridge(), resolver, engine_options, progress_, std::make_shared<Logger>("transfer"));
  auto conflicts = conflict_resolver();

  auto on_progress = [this](const std::string& serial, AssetClass asset_class,
                            std::size_t current, std::size_t total, const std::string& filename) {
    logger_->print("  [{}] {} {}/{} {}", serial, asset_class_label(asset_class), current, total, filename);
  };

  for(auto& target : targets) {
    logger_->print("Transferring to {} device {}", device_role_label(target.role), target.serial);
    transfer_results_.push_back(engine.transfer(target, scope, *conflicts, on_progress));
  }
  print_transfer_summary();
  bool clean = std::all_of(transfer_results_.begin(), transfer_results_.end(),
                           [](const TransferResult& r){ return r.clean(); });
  return clean ? 0 : 1;
}

void OnboardApp::print_transfer_summary() const {
  logger_->print("Transfer summary:");
  for(const auto& result : transfer_results_) {
    logger_->print("  {} ({}) {}", result.serial, device_role_label(result.role),
                   result.base_path.empty() ? "-" : result.base_path);
    for(auto asset_class : {AssetClass::Json, AssetClass::Videos, AssetClass::Images}) {
      const auto& row = result.at(asset_class);
      logger_->print("    {:<7} {:<11} {}/{} ok, {} failed, {} skipped", asset_class_label(asset_class),
                     transfer_status_label(row.status), row.succeeded, row.total, row.failed, row.skipped);
    }
    if(result.device_failed()) {
      logger_->print_err("    error: {} ({})", result.detail, error_kind_label(result.error));
    }
    for(const auto& name : result.failed_files) {
      logger_->print_err("    failed: {}", name);
    }
  }
  auto summary = progress_->summary();
  logger_->print("Devices {}/{} complete, {} failed transfer(s), files {}/{}",
                 summary.completed_devices, summary.total_devices, summary.failed_transfers,
                 summary.completed_files, summary.total_files);
}

int OnboardApp::deploy() {
  if(!settings_->get<bool>("skip_fetch")) {
    logger_->print("Step 1: fetching content data");
    if(fetch_data() != 0) return 1;
  }
  if(!settings_->get<bool>("skip_download")) {
    logger_->print("Step 2: downloading assets");
    if(download() != 0) return 1;
  }
  logger_->print("Step 3: transferring to devices");
  int status = transfer();
  logger_->print("Step 4: verifying deployment");
  if(verify_deployment() != 0) status = 1;
  if(status == 0) logger_->print("Deployment completed successfully");
  return status;
}

int OnboardApp::show_settings() {
  for(const auto& key : settings_->keys()) {
    auto value = settings_->value_as_string(key);
    if(key == "password" && !value.empty()) value = "********";
    logger_->print("{:<26} {}", key, value);
  }
  logger_->print("Configuration file: {}", settings_->settings_path().string());
  auto issues = validate_settings(*settings_);
  for(const auto& issue : issues) logger_->print_err("Configuration: {}", issue);
  return issues.empty() ? 0 : 1;
}
