#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class DownloadCategory { VideoHigh, VideoLow, Thumbnail, TagImage };

const char* download_category_label(DownloadCategory category);

struct DownloadStats {
  std::size_t videos_high = 0;
  std::size_t videos_low = 0;
  std::size_t thumbnails = 0;
  std::size_t tag_images = 0;
  std::size_t failed_downloads = 0;
  std::size_t skipped_files = 0;
  std::size_t total_files = 0;    // after the pre-filter
  std::size_t completed = 0;      // successes plus failures
  uint64_t bytes_downloaded = 0;

  bool operator==(const DownloadStats& other) const;
  bool operator!=(const DownloadStats& other) const { return !(*this == other); }
};

enum class TransferStatus { Pending, InProgress, Completed, Failed };
enum class AssetClass { Json, Videos, Images };

const char* transfer_status_label(TransferStatus status);
const char* asset_class_label(AssetClass asset_class);

struct ClassProgress {
  TransferStatus status = TransferStatus::Pending;
  std::size_t current = 0;
  std::size_t total = 0;
  uint64_t bytes = 0;
};

struct DeviceProgress {
  std::string serial;
  std::string role;
  ClassProgress json;
  ClassProgress videos;
  ClassProgress images;

  ClassProgress& at(AssetClass asset_class);
  const ClassProgress& at(AssetClass asset_class) const;
};

struct ProgressSummary {
  std::size_t total_devices = 0;
  std::size_t completed_devices = 0;
  std::size_t failed_transfers = 0;
  std::size_t total_files = 0;
  std::size_t completed_files = 0;
};

// (id, current, total, status) as handed to renderers. total is empty when
// unknown, e.g. a download without Content-Length.
struct ProgressEvent {
  std::string id;
  uint64_t current = 0;
  std::optional<uint64_t> total;
  std::string status;
};

std::optional<double> percent_complete(uint64_t current, std::optional<uint64_t> total);

// Shared counters for both engines. All updates happen under one mutex and
// the listener is called after the lock is released.
class ProgressTracker {
public:
  using Listener = std::function<void(const ProgressEvent&)>;

  void set_listener(Listener listener);

  // downloads
  void begin_downloads(std::size_t total_files, std::size_t skipped_files);
  void add_download_bytes(const std::string& task_id, uint64_t bytes, std::optional<uint64_t> content_length);
  // Takes back the bytes of a failed attempt, both in the aggregate and in
  // the task's own counter, so a retry starts again from zero.
  void rewind_download_bytes(const std::string& task_id, uint64_t bytes);
  void record_download(DownloadCategory category, bool success, const std::string& task_id);
  DownloadStats download_stats() const;

  // device transfers
  void begin_device(const std::string& serial, const std::string& role);
  void set_class_total(const std::string& serial, AssetClass asset_class, std::size_t total);
  void set_class_status(const std::string& serial, AssetClass asset_class, TransferStatus status);
  void advance_class(const std::string& serial, AssetClass asset_class, std::size_t current, uint64_t bytes);
  std::optional<DeviceProgress> device(const std::string& serial) const;
  std::vector<DeviceProgress> devices() const;

  ProgressSummary summary() const;
  void reset();

private:
  void notify(const ProgressEvent& event) const;

  mutable std::mutex mutex_;
  DownloadStats downloads_;
  std::map<std::string, uint64_t> task_bytes_;
  std::vector<DeviceProgress> devices_;
  Listener listener_;
};
