#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "device_bridge.hpp"
#include "log.hpp"
#include "storage_resolver.hpp"

struct StorageInfo {
  std::string used_space;        // du -sh of the base directory
  std::string total_space;       // df of shared storage
  std::string available_space;
};

struct DeploymentReport {
  std::string serial;
  DeviceRole role = DeviceRole::Master;
  std::string base_path;
  bool json_exists = false;
  bool credential_exists = false;
  std::size_t video_count = 0;
  std::size_t image_count = 0;
  std::optional<StorageInfo> storage;

  // A deployment counts as present once the manifest is on the device.
  bool verified() const { return json_exists; }
};

class DeploymentVerifier {
public:
  struct Options {
    std::vector<std::string> search_paths;   // primary first, then fallbacks
    std::string storage_root = "/storage/emulated/0";
    std::chrono::milliseconds timeout{30000};
  };

  DeploymentVerifier(std::shared_ptr<DeviceBridge> bridge,
                     Options options,
                     std::shared_ptr<Logger> logger = nullptr);

  // First search path that already holds a new_data.json, else the first
  // existing directory. Leaves the target untouched when neither is found.
  bool locate(DeviceTarget& device);

  DeploymentReport inspect(DeviceTarget& device);

  // touch/rm probe under the base directory.
  bool write_probe(const DeviceTarget& device);

  std::optional<StorageInfo> storage_info(const DeviceTarget& device);

  static std::optional<std::size_t> parse_count(const std::string& text);
  static std::optional<StorageInfo> parse_storage(const std::string& du_output,
                                                  const std::string& df_output);

private:
  std::size_t count_files(const DeviceTarget& device, const std::string& dir, bool videos_only);

  std::shared_ptr<DeviceBridge> bridge_;
  Options options_;
  std::shared_ptr<Logger> logger_;
};
