#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "conflict_detector.hpp"
#include "conflict_resolver.hpp"
#include "device_bridge.hpp"
#include "errors.hpp"
#include "local_file_set.hpp"
#include "log.hpp"
#include "progress_tracker.hpp"
#include "storage_resolver.hpp"

struct ClassResult {
  TransferStatus status = TransferStatus::Pending;
  std::size_t total = 0;
  std::size_t processed = 0;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  std::size_t skipped = 0;
  uint64_t bytes = 0;
};

struct TransferResult {
  std::string serial;
  DeviceRole role = DeviceRole::Master;
  std::string base_path;
  ClassResult json;
  ClassResult videos;
  ClassResult images;
  ErrorKind error = ErrorKind::None;   // fatal error for this device, if any
  std::string detail;
  std::vector<std::string> failed_files;

  ClassResult& at(AssetClass asset_class);
  const ClassResult& at(AssetClass asset_class) const;

  bool device_failed() const { return error != ErrorKind::None; }
  // No fatal error and no per-file failure.
  bool clean() const;
};

// Per-file progress: (serial, class, current, total, filename).
using TransferProgressCallback = std::function<void(const std::string& serial,
                                                    AssetClass asset_class,
                                                    std::size_t current,
                                                    std::size_t total,
                                                    const std::string& filename)>;

// State that belongs to one transfer() call: the conflict decision and the
// names it skips. Nothing here outlives the call.
struct TransferSession {
  std::optional<ConflictResolution> resolution;
  std::set<std::string> skipped;
  bool cancelled = false;
};

class TransferEngine {
public:
  struct Options {
    std::filesystem::path downloads_root = "downloads";
  };

  TransferEngine(std::shared_ptr<DeviceBridge> bridge,
                 std::shared_ptr<StorageResolver> resolver,
                 Options options,
                 std::shared_ptr<ProgressTracker> progress = nullptr,
                 std::shared_ptr<Logger> logger = nullptr);

  // Pushes the role's share of the downloads root onto one device. Per-file
  // failures are tallied in the result; BridgeUnavailable is rethrown after
  // the device has been marked failed.
  TransferResult transfer(DeviceTarget& device,
                          const TransferScope& scope,
                          ConflictResolver& conflicts,
                          const TransferProgressCallback& on_progress = {});

  // Stops further pushes on every running transfer; the current push finishes.
  void request_cancel() { cancel_requested_ = true; }
  void reset_cancel() { cancel_requested_ = false; }
  bool cancel_requested() const { return cancel_requested_; }

  const Options& options() const { return options_; }

private:
  void run(DeviceTarget& device,
           const TransferScope& scope,
           ConflictResolver& conflicts,
           const TransferProgressCallback& on_progress,
           TransferSession& session,
           TransferResult& result);
  bool prepare_directories(const DeviceTarget& device);
  bool clean_remote(const DeviceTarget& device);
  void fail_device(const DeviceTarget& device,
                   const TransferScope& scope,
                   TransferResult& result,
                   ErrorKind error,
                   const std::string& detail);
  void push_class(const DeviceTarget& device,
                  AssetClass asset_class,
                  const std::vector<std::pair<std::string, std::filesystem::path>>& files,
                  TransferSession& session,
                  TransferResult& result,
                  const TransferProgressCallback& on_progress);
  void set_status(const DeviceTarget& device, TransferResult& result,
                  AssetClass asset_class, TransferStatus status);

  std::shared_ptr<DeviceBridge> bridge_;
  std::shared_ptr<StorageResolver> resolver_;
  ConflictDetector detector_;
  Options options_;
  std::shared_ptr<ProgressTracker> progress_;
  std::shared_ptr<Logger> logger_;
  std::atomic<bool> cancel_requested_{false};
};
