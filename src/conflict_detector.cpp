#include "conflict_detector.hpp"

#include <algorithm>
#include <unordered_map>

bool ConflictReport::is_conflict(const std::string& filename) const {
  return std::any_of(conflicts.begin(), conflicts.end(),
                     [&](const FileConflict& c){ return c.filename == filename; });
}

std::string remote_directory_for(const DeviceTarget& device, AssetClass asset_class) {
  switch(asset_class) {
    case AssetClass::Json: return device.base_path;
    case AssetClass::Videos: return device.video_path;
    case AssetClass::Images: break;
  }
  return device.image_path;
}

ConflictDetector::ConflictDetector(std::shared_ptr<DeviceBridge> bridge,
                                   std::shared_ptr<Logger> logger)
  : bridge_(std::move(bridge)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("conflicts")) {}

ConflictReport ConflictDetector::check(const DeviceTarget& device, const LocalFileSet& files) {
  ConflictReport report;
  for(auto asset_class : {AssetClass::Json, AssetClass::Videos, AssetClass::Images}) {
    const auto& class_files = files.at(asset_class);
    if(class_files.empty()) continue;
    check_directory(device, remote_directory_for(device, asset_class), asset_class, class_files, report);
  }
  if(report.has_conflicts()) {
    logger_->info("{}: {} of {} files already on device", device.serial,
                  report.conflicts.size(), files.size());
  }
  return report;
}

void ConflictDetector::check_directory(const DeviceTarget& device,
                                       const std::string& remote_dir,
                                       AssetClass asset_class,
                                       const FileMap& files,
                                       ConflictReport& report) {
  auto listing = bridge_->list_directory(device.serial, remote_dir);
  if(listing) {
    std::unordered_map<std::string, uint64_t> remote;
    for(const auto& entry : *listing) {
      if(!entry.is_directory) remote.emplace(entry.name, entry.size);
    }
    for(const auto& [name, path] : files) {
      auto it = remote.find(name);
      if(it == remote.end()) {
        report.safe_files.push_back(name);
      } else {
        report.conflicts.push_back(FileConflict{name, asset_class, local_file_size(path), it->second});
      }
    }
    return;
  }

  // Listing failed; probe each name, sizes stay unknown.
  logger_->debug("{}: cannot list {}, probing files one by one", device.serial, remote_dir);
  for(const auto& [name, path] : files) {
    if(bridge_->test_path(device.serial, remote_dir + "/" + name, PathTest::Exists)) {
      report.conflicts.push_back(FileConflict{name, asset_class, local_file_size(path), std::nullopt});
    } else {
      report.safe_files.push_back(name);
    }
  }
}
