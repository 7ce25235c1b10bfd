#include "progress_tracker.hpp"

#include <algorithm>

const char* download_category_label(DownloadCategory category) {
  switch(category) {
    case DownloadCategory::VideoHigh: return "video_high";
    case DownloadCategory::VideoLow: return "video_low";
    case DownloadCategory::Thumbnail: return "thumbnail";
    case DownloadCategory::TagImage: return "tag_image";
  }
  return "unknown";
}

const char* transfer_status_label(TransferStatus status) {
  switch(status) {
    case TransferStatus::Pending: return "pending";
    case TransferStatus::InProgress: return "in_progress";
    case TransferStatus::Completed: return "completed";
    case TransferStatus::Failed: return "failed";
  }
  return "unknown";
}

const char* asset_class_label(AssetClass asset_class) {
  switch(asset_class) {
    case AssetClass::Json: return "json";
    case AssetClass::Videos: return "videos";
    case AssetClass::Images: return "images";
  }
  return "unknown";
}

bool DownloadStats::operator==(const DownloadStats& other) const {
  return videos_high == other.videos_high &&
         videos_low == other.videos_low &&
         thumbnails == other.thumbnails &&
         tag_images == other.tag_images &&
         failed_downloads == other.failed_downloads &&
         skipped_files == other.skipped_files &&
         total_files == other.total_files &&
         completed == other.completed &&
         bytes_downloaded == other.bytes_downloaded;
}

ClassProgress& DeviceProgress::at(AssetClass asset_class) {
  switch(asset_class) {
    case AssetClass::Json: return json;
    case AssetClass::Videos: return videos;
    case AssetClass::Images: break;
  }
  return images;
}

const ClassProgress& DeviceProgress::at(AssetClass asset_class) const {
  return const_cast<DeviceProgress*>(this)->at(asset_class);
}

std::optional<double> percent_complete(uint64_t current, std::optional<uint64_t> total) {
  if(!total || *total == 0) return std::nullopt;
  return static_cast<double>(current) / static_cast<double>(*total) * 100.0;
}

void ProgressTracker::set_listener(Listener listener) {
  std::lock_guard lg(mutex_);
  listener_ = std::move(listener);
}

void ProgressTracker::notify(const ProgressEvent& event) const {
  Listener listener;
  {
    std::lock_guard lg(mutex_);
    listener = listener_;
  }
  if(listener) listener(event);
}

void ProgressTracker::begin_downloads(std::size_t total_files, std::size_t skipped_files) {
  {
    std::lock_guard lg(mutex_);
    downloads_ = DownloadStats{};
    downloads_.total_files = total_files;
    downloads_.skipped_files = skipped_files;
    task_bytes_.clear();
  }
  notify(ProgressEvent{"downloads", 0, total_files, "started"});
}

void ProgressTracker::add_download_bytes(const std::string& task_id,
                                         uint64_t bytes,
                                         std::optional<uint64_t> content_length) {
  uint64_t task_total = 0;
  {
    std::lock_guard lg(mutex_);
    downloads_.bytes_downloaded += bytes;
    task_total = (task_bytes_[task_id] += bytes);
  }
  notify(ProgressEvent{task_id, task_total, content_length, "downloading"});
}

void ProgressTracker::rewind_download_bytes(const std::string& task_id, uint64_t bytes) {
  std::lock_guard lg(mutex_);
  downloads_.bytes_downloaded -= std::min(bytes, downloads_.bytes_downloaded);
  task_bytes_.erase(task_id);
}

void ProgressTracker::record_download(DownloadCategory category, bool success, const std::string& task_id) {
  std::size_t completed = 0;
  std::size_t total = 0;
  {
    std::lock_guard lg(mutex_);
    if(success) {
      switch(category) {
        case DownloadCategory::VideoHigh: downloads_.videos_high++; break;
        case DownloadCategory::VideoLow: downloads_.videos_low++; break;
        case DownloadCategory::Thumbnail: downloads_.thumbnails++; break;
        case DownloadCategory::TagImage: downloads_.tag_images++; break;
      }
    } else {
      downloads_.failed_downloads++;
    }
    completed = ++downloads_.completed;
    total = downloads_.total_files;
    task_bytes_.erase(task_id);
  }
  notify(ProgressEvent{task_id, 1, 1, success ? "completed" : "failed"});
  notify(ProgressEvent{"downloads", completed, total, completed == total ? "completed" : "downloading"});
}

DownloadStats ProgressTracker::download_stats() const {
  std::lock_guard lg(mutex_);
  return downloads_;
}

void ProgressTracker::begin_device(const std::string& serial, const std::string& role) {
  {
    std::lock_guard lg(mutex_);
    auto it = std::find_if(devices_.begin(), devices_.end(),
                           [&](const DeviceProgress& d){ return d.serial == serial; });
    if(it == devices_.end()) {
      devices_.push_back(DeviceProgress{});
      it = std::prev(devices_.end());
    }
    *it = DeviceProgress{};
    it->serial = serial;
    it->role = role;
  }
  notify(ProgressEvent{serial, 0, std::nullopt, "started"});
}

void ProgressTracker::set_class_total(const std::string& serial, AssetClass asset_class, std::size_t total) {
  std::lock_guard lg(mutex_);
  for(auto& device : devices_) {
    if(device.serial == serial) device.at(asset_class).total = total;
  }
}

void ProgressTracker::set_class_status(const std::string& serial, AssetClass asset_class, TransferStatus status) {
  std::size_t current = 0;
  std::size_t total = 0;
  {
    std::lock_guard lg(mutex_);
    for(auto& device : devices_) {
      if(device.serial != serial) continue;
      auto& row = device.at(asset_class);
      row.status = status;
      current = row.current;
      total = row.total;
    }
  }
  notify(ProgressEvent{serial + ":" + asset_class_label(asset_class), current, total,
                       transfer_status_label(status)});
}

void ProgressTracker::advance_class(const std::string& serial,
                                    AssetClass asset_class,
                                    std::size_t current,
                                    uint64_t bytes) {
  std::size_t total = 0;
  {
    std::lock_guard lg(mutex_);
    for(auto& device : devices_) {
      if(device.serial != serial) continue;
      auto& row = device.at(asset_class);
      row.current = current;
      row.bytes += bytes;
      if(row.status == TransferStatus::Pending) row.status = TransferStatus::InProgress;
      total = row.total;
    }
  }
  notify(ProgressEvent{serial + ":" + asset_class_label(asset_class), current, total, "in_progress"});
}

std::optional<DeviceProgress> ProgressTracker::device(const std::string& serial) const {
  std::lock_guard lg(mutex_);
  for(const auto& device : devices_) {
    if(device.serial == serial) return device;
  }
  return std::nullopt;
}

std::vector<DeviceProgress> ProgressTracker::devices() const {
  std::lock_guard lg(mutex_);
  return devices_;
}

ProgressSummary ProgressTracker::summary() const {
  std::lock_guard lg(mutex_);
  ProgressSummary summary;
  summary.total_devices = devices_.size();
  for(const auto& device : devices_) {
    bool any_failed = false;
    bool all_done = true;
    for(const auto* row : {&device.json, &device.videos, &device.images}) {
      summary.total_files += row->total;
      summary.completed_files += row->current;
      if(row->status == TransferStatus::Failed) {
        summary.failed_transfers++;
        any_failed = true;
      }
      if(row->status != TransferStatus::Completed && row->status != TransferStatus::Pending) {
        all_done = false;
      }
    }
    if(all_done && !any_failed) summary.completed_devices++;
  }
  return summary;
}

void ProgressTracker::reset() {
  std::lock_guard lg(mutex_);
  downloads_ = DownloadStats{};
  task_bytes_.clear();
  devices_.clear();
}
