#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "device_bridge.hpp"
#include "local_file_set.hpp"
#include "log.hpp"
#include "storage_resolver.hpp"

struct FileConflict {
  std::string filename;
  AssetClass asset_class = AssetClass::Json;
  uint64_t local_size = 0;
  std::optional<uint64_t> remote_size;   // empty when the device could not report it
};

struct ConflictReport {
  std::vector<std::string> safe_files;
  std::vector<FileConflict> conflicts;

  bool has_conflicts() const { return !conflicts.empty(); }
  bool is_conflict(const std::string& filename) const;
};

// Compares a LocalFileSet against the device once, before any push, so the
// whole conflict set can be presented in one decision. A remote file with
// the same name is a conflict even when the sizes match.
class ConflictDetector {
public:
  explicit ConflictDetector(std::shared_ptr<DeviceBridge> bridge,
                            std::shared_ptr<Logger> logger = nullptr);

  ConflictReport check(const DeviceTarget& device, const LocalFileSet& files);

private:
  void check_directory(const DeviceTarget& device,
                       const std::string& remote_dir,
                       AssetClass asset_class,
                       const FileMap& files,
                       ConflictReport& report);

  std::shared_ptr<DeviceBridge> bridge_;
  std::shared_ptr<Logger> logger_;
};

std::string remote_directory_for(const DeviceTarget& device, AssetClass asset_class);
