#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "conflict_resolver.hpp"
#include "deployment_verifier.hpp"
#include "device_bridge.hpp"
#include "download_engine.hpp"
#include "log.hpp"
#include "progress_tracker.hpp"
#include "storage_resolver.hpp"
#include "transfer_engine.hpp"

class HttpClient;
class SettingsManager;

// Runs one command from the settings against a device bridge and the
// content backend. Every collaborator can be injected; the defaults are
// built from the settings on first use.
class OnboardApp {
public:
  struct Options {
    std::shared_ptr<DeviceBridge> bridge;
    AssetFetcher fetcher;
    std::shared_ptr<ConflictResolver> conflicts;
    std::shared_ptr<RootAccessCache> root_cache;
  };

  explicit OnboardApp(std::shared_ptr<SettingsManager> settings, Options options = {});

  // Dispatches settings["command"]. Returns the process exit status.
  int run();
  int run_command(const std::string& command);

  int list_devices();
  int verify();
  int fetch_data();
  int download();
  int transfer();
  int deploy();
  int show_settings();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<ProgressTracker> progress() const { return progress_; }

  const std::vector<TransferResult>& transfer_results() const { return transfer_results_; }
  const std::optional<DownloadStats>& download_stats() const { return download_stats_; }

  static const std::vector<std::string>& commands();

private:
  std::shared_ptr<DeviceBridge> bridge();
  std::shared_ptr<const HttpClient> http_client();
  std::shared_ptr<ConflictResolver> conflict_resolver();
  std::filesystem::path downloads_root() const;
  StorageResolver::Options storage_options() const;
  std::vector<std::string> search_paths() const;

  // Master then slave, honouring master_only/slave_only. With auto set the
  // first two online devices are taken and written back into the settings.
  bool select_targets(bool auto_detect, std::vector<DeviceTarget>& targets);
  bool require_online(const std::vector<DeviceInfo>& online, const std::string& serial) const;

  int verify_device(const std::string& serial);
  int verify_deployment();
  void print_transfer_summary() const;
  void print_download_stats(const DownloadStats& stats) const;

  std::shared_ptr<SettingsManager> settings_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<ProgressTracker> progress_;
  std::shared_ptr<const HttpClient> http_;
  std::vector<TransferResult> transfer_results_;
  std::optional<DownloadStats> download_stats_;
};
