#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct DeviceInfo {
  std::string serial;
  std::string status;          // "device", "offline", "unauthorized", ...
  std::string model = "Unknown";
  std::string product = "Unknown";

  bool online() const { return status == "device"; }
};

struct ShellResult {
  int exit_code = -1;
  std::string out;
  std::string err;
  bool timed_out = false;

  bool ok() const { return !timed_out && exit_code == 0; }
};

struct RemoteEntry {
  std::string name;
  uint64_t size = 0;
  bool is_directory = false;
};

enum class PathTest { Exists, Directory, File, Writable };

// Narrow view of a device transport. Device side failures and single
// timeouts come back as return values; implementations throw
// OnboardError(BridgeUnavailable) when the transport itself is gone.
class DeviceBridge {
public:
  virtual ~DeviceBridge() = default;

  virtual std::vector<DeviceInfo> list_devices() = 0;
  virtual bool test_path(const std::string& serial, const std::string& path, PathTest mode) = 0;
  virtual bool make_dirs(const std::string& serial, const std::string& path) = 0;
  virtual bool push(const std::string& serial,
                    const std::string& local_path,
                    const std::string& remote_path,
                    std::string& error) = 0;
  virtual bool remove_path(const std::string& serial, const std::string& path) = 0;
  virtual ShellResult shell(const std::string& serial,
                            const std::string& command,
                            std::chrono::milliseconds timeout) = 0;
  // nullopt when the directory could not be listed at all.
  virtual std::optional<std::vector<RemoteEntry>> list_directory(const std::string& serial,
                                                                 const std::string& path) = 0;
};

// Single-quotes a value for the device shell.
inline std::string shell_quote(const std::string& value) {
  std::string result;
  result.reserve(value.size() + 2);
  result.push_back('\'');
  for(char c : value) {
    if(c == '\'') {
      result.append("'\\''");
    } else {
      result.push_back(c);
    }
  }
  result.push_back('\'');
  return result;
}
