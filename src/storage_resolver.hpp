#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "device_bridge.hpp"
#include "errors.hpp"
#include "log.hpp"

enum class DeviceRole { Master, Slave };

const char* device_role_label(DeviceRole role);

struct DeviceTarget {
  std::string serial;
  DeviceRole role = DeviceRole::Master;
  std::string base_path;
  std::string video_path;
  std::string image_path;

  DeviceTarget() = default;
  DeviceTarget(std::string serial, DeviceRole role, const std::string& base);

  // Re-derives the Video and Image directories from a new base.
  void set_base_path(const std::string& base);
};

enum class StorageSource { Primary, Elevated, Fallback };

const char* storage_source_label(StorageSource source);

struct StorageResolution {
  bool success = false;
  std::string base_path;
  StorageSource source = StorageSource::Primary;
  ErrorKind error = ErrorKind::None;
  std::string detail;
};

// Per-serial memo of whether `su` gives uid 0. Written once per serial and
// shared by every resolver in the process.
class RootAccessCache {
public:
  std::optional<bool> lookup(const std::string& serial) const;
  void store(const std::string& serial, bool has_root);

  static std::shared_ptr<RootAccessCache> shared();

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, bool> entries_;
};

// Package-scoped storage first, then legacy public storage and alternate mounts.
std::vector<std::string> default_fallback_paths();

class StorageResolver {
public:
  struct Options {
    std::string primary_path = "/storage/emulated/0/Download/EldersVR";
    std::vector<std::string> fallback_paths = default_fallback_paths();
    bool allow_root = true;
    std::chrono::milliseconds probe_timeout{15000};
  };

  StorageResolver(std::shared_ptr<DeviceBridge> bridge,
                  Options options,
                  std::shared_ptr<RootAccessCache> root_cache = RootAccessCache::shared(),
                  std::shared_ptr<Logger> logger = nullptr);

  // Finds a writable base for the device and, on success, points the
  // target's base/video/image paths at it. BridgeUnavailable propagates.
  StorageResolution resolve(DeviceTarget& device);

  bool has_root(const std::string& serial);
  const Options& options() const { return options_; }

private:
  bool usable(const std::string& serial, const std::string& path);
  bool detect_root(const std::string& serial);
  bool escalate_primary(const std::string& serial);

  std::shared_ptr<DeviceBridge> bridge_;
  Options options_;
  std::shared_ptr<RootAccessCache> root_cache_;
  std::shared_ptr<Logger> logger_;
};
