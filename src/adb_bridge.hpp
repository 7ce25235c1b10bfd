#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "device_bridge.hpp"
#include "log.hpp"

// DeviceBridge speaking the adb server's smart-socket protocol directly.
// Every call opens its own server connection, so the bridge can be shared
// across threads.
class AdbBridge : public DeviceBridge {
public:
  struct Options {
    std::string host = "127.0.0.1";
    uint16_t port = 5037;
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds command_timeout{15000};
    std::chrono::milliseconds push_timeout{300000};   // inactivity, not total
    std::size_t max_consecutive_timeouts = 3;
  };

  explicit AdbBridge(Options options, std::shared_ptr<Logger> logger = nullptr);

  std::vector<DeviceInfo> list_devices() override;
  bool test_path(const std::string& serial, const std::string& path, PathTest mode) override;
  bool make_dirs(const std::string& serial, const std::string& path) override;
  bool push(const std::string& serial,
            const std::string& local_path,
            const std::string& remote_path,
            std::string& error) override;
  bool remove_path(const std::string& serial, const std::string& path) override;
  ShellResult shell(const std::string& serial,
                    const std::string& command,
                    std::chrono::milliseconds timeout) override;
  std::optional<std::vector<RemoteEntry>> list_directory(const std::string& serial,
                                                         const std::string& path) override;

  const Options& options() const { return options_; }

  // Parses `host:devices-l` / `adb devices -l` text.
  static std::vector<DeviceInfo> parse_device_list(const std::string& text);
  // Splits the legacy shell output at the exit marker; returns false when the
  // marker is missing (command cut short).
  static bool split_exit_marker(const std::string& raw, std::string& output, int& exit_code);

  static constexpr std::size_t kSyncDataMax = 64 * 1024;
  static constexpr const char* kExitMarker = "__ONBOARD_EXIT__:";

private:
  std::vector<std::string> device_features(const std::string& serial);
  bool has_feature(const std::string& serial, const std::string& feature);
  void note_timeout(const std::string& what);
  void note_success();

  Options options_;
  std::shared_ptr<Logger> logger_;
  std::mutex features_mutex_;
  std::unordered_map<std::string, std::vector<std::string>> features_;
  std::atomic<std::size_t> consecutive_timeouts_{0};
};
