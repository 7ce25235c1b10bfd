#include "adb_bridge.hpp"

#include <asio.hpp>

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "errors.hpp"

namespace {

using asio::ip::tcp;
using Clock = std::chrono::steady_clock;

struct AdbTimeout : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Server replied FAIL, spoke garbage, or the socket broke mid exchange.
struct AdbFailure : std::runtime_error {
  using std::runtime_error::runtime_error;
};

constexpr uint32_t make_id(char a, char b, char c, char d) {
  return static_cast<uint32_t>(static_cast<uint8_t>(a)) |
         (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 8) |
         (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 16) |
         (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 24);
}

constexpr uint32_t kIdList = make_id('L','I','S','T');
constexpr uint32_t kIdDent = make_id('D','E','N','T');
constexpr uint32_t kIdSend = make_id('S','E','N','D');
constexpr uint32_t kIdData = make_id('D','A','T','A');
constexpr uint32_t kIdDone = make_id('D','O','N','E');
constexpr uint32_t kIdOkay = make_id('O','K','A','Y');
constexpr uint32_t kIdFail = make_id('F','A','I','L');
constexpr uint32_t kIdQuit = make_id('Q','U','I','T');

constexpr uint32_t kPushMode = 0100644;   // regular file, rw-r--r--
constexpr uint32_t kModeTypeMask = 0170000;
constexpr uint32_t kModeDirectory = 0040000;

enum ShellPacket : uint8_t {
  kShellStdout = 1,
  kShellStderr = 2,
  kShellExit = 3
};

void put_le32(std::string& out, uint32_t value) {
  for(int i = 0; i < 4; ++i) {
    out.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
  }
}

uint32_t get_le32(const unsigned char* in) {
  return static_cast<uint32_t>(in[0]) |
         (static_cast<uint32_t>(in[1]) << 8) |
         (static_cast<uint32_t>(in[2]) << 16) |
         (static_cast<uint32_t>(in[3]) << 24);
}

std::string sync_header(uint32_t id, uint32_t value) {
  std::string out;
  out.reserve(8);
  put_le32(out, id);
  put_le32(out, value);
  return out;
}

std::chrono::milliseconds remaining(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  if(left.count() <= 0) throw AdbTimeout("deadline exceeded");
  return left;
}

// One connection to the adb server. Blocking calls are built from async
// operations plus io_context::run_for so that every step honours a timeout.
class AdbSocket {
public:
  AdbSocket(const std::string& host, uint16_t port)
    : host_(host), port_(port), socket_(io_) {}

  ~AdbSocket() {
    std::error_code ignored;
    socket_.close(ignored);
  }

  void connect(std::chrono::milliseconds timeout) {
    std::error_code ec;
    tcp::resolver resolver(io_);
    auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
    if(ec) {
      throw OnboardError(ErrorKind::BridgeUnavailable,
                         "cannot resolve adb server " + host_ + ": " + ec.message());
    }
    std::error_code result = asio::error::would_block;
    asio::async_connect(socket_, endpoints,
      [&](const std::error_code& error, const tcp::endpoint&){ result = error; });
    wait(timeout, "connect");
    if(result) {
      throw OnboardError(ErrorKind::BridgeUnavailable,
                         "adb server not reachable at " + host_ + ":" + std::to_string(port_) +
                         " (" + result.message() + ")");
    }
    socket_.set_option(tcp::no_delay(true), ec);
  }

  void send_request(const std::string& payload, std::chrono::milliseconds timeout) {
    char prefix[5];
    std::snprintf(prefix, sizeof(prefix), "%04zx", payload.size());
    write_all(std::string(prefix, 4) + payload, timeout);
  }

  void expect_okay(std::chrono::milliseconds timeout) {
    std::string status = read_string(4, timeout);
    if(status == "OKAY") return;
    if(status != "FAIL") {
      throw AdbFailure("protocol fault (status '" + status + "')");
    }
    throw AdbFailure(read_length_prefixed(timeout));
  }

  std::string read_length_prefixed(std::chrono::milliseconds timeout) {
    std::string length = read_string(4, timeout);
    std::size_t size = 0;
    try {
      size = std::stoul(length, nullptr, 16);
    } catch(const std::exception&) {
      throw AdbFailure("bad length prefix '" + length + "'");
    }
    return read_string(size, timeout);
  }

  std::string read_string(std::size_t size, std::chrono::milliseconds timeout) {
    std::string out(size, '\0');
    if(size > 0) read_exact(out.data(), size, timeout);
    return out;
  }

  void write_all(const std::string& data, std::chrono::milliseconds timeout) {
    write_all(data.data(), data.size(), timeout);
  }

  void write_all(const char* data, std::size_t size, std::chrono::milliseconds timeout) {
    std::error_code result = asio::error::would_block;
    asio::async_write(socket_, asio::buffer(data, size),
      [&](const std::error_code& error, std::size_t){ result = error; });
    wait(timeout, "write");
    if(result) throw AdbFailure("write failed: " + result.message());
  }

  void read_exact(char* data, std::size_t size, std::chrono::milliseconds timeout) {
    std::error_code result = asio::error::would_block;
    asio::async_read(socket_, asio::buffer(data, size),
      [&](const std::error_code& error, std::size_t){ result = error; });
    wait(timeout, "read");
    if(result == asio::error::eof) throw AdbFailure("connection closed by adb server");
    if(result) throw AdbFailure("read failed: " + result.message());
  }

  // Returns 0 at end of stream.
  std::size_t read_some(char* data, std::size_t size, std::chrono::milliseconds timeout) {
    std::error_code result = asio::error::would_block;
    std::size_t transferred = 0;
    socket_.async_read_some(asio::buffer(data, size),
      [&](const std::error_code& error, std::size_t n){ result = error; transferred = n; });
    wait(timeout, "read");
    if(result == asio::error::eof) return 0;
    if(result) throw AdbFailure("read failed: " + result.message());
    return transferred;
  }

private:
  void wait(std::chrono::milliseconds timeout, const char* what) {
    io_.restart();
    io_.run_for(timeout);
    if(!io_.stopped()) {
      std::error_code ignored;
      socket_.close(ignored);
      io_.run();
      throw AdbTimeout(std::string(what) + " timed out after " + std::to_string(timeout.count()) + "ms");
    }
  }

  std::string host_;
  uint16_t port_;
  asio::io_context io_;
  tcp::socket socket_;
};

std::vector<std::string> split(const std::string& text, char delimiter) {
  std::vector<std::string> out;
  std::string item;
  std::istringstream in(text);
  while(std::getline(in, item, delimiter)) {
    if(!item.empty()) out.push_back(item);
  }
  return out;
}

} // namespace

AdbBridge::AdbBridge(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("adb")) {}

void AdbBridge::note_timeout(const std::string& what) {
  auto count = ++consecutive_timeouts_;
  logger_->warn("{} (consecutive timeouts: {})", what, count);
  if(count >= options_.max_consecutive_timeouts) {
    throw OnboardError(ErrorKind::BridgeUnavailable,
                       "device bridge stopped responding after " + std::to_string(count) +
                       " consecutive timeouts");
  }
}

void AdbBridge::note_success() {
  consecutive_timeouts_ = 0;
}

std::vector<DeviceInfo> AdbBridge::parse_device_list(const std::string& text) {
  std::vector<DeviceInfo> devices;
  std::istringstream lines(text);
  std::string line;
  while(std::getline(lines, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(line.empty()) continue;
    if(line.rfind("List of devices", 0) == 0) continue;
    if(line.rfind("* ", 0) == 0) continue;   // daemon start chatter

    std::istringstream tokens(line);
    DeviceInfo info;
    if(!(tokens >> info.serial)) continue;
    if(!(tokens >> info.status)) continue;
    std::string token;
    while(tokens >> token) {
      if(token.rfind("model:", 0) == 0) {
        info.model = token.substr(6);
      } else if(token.rfind("product:", 0) == 0) {
        info.product = token.substr(8);
      }
    }
    devices.push_back(std::move(info));
  }
  return devices;
}

bool AdbBridge::split_exit_marker(const std::string& raw, std::string& output, int& exit_code) {
  auto pos = raw.rfind(kExitMarker);
  if(pos == std::string::npos) {
    output = raw;
    return false;
  }
  output = raw.substr(0, pos);
  try {
    exit_code = std::stoi(raw.substr(pos + std::strlen(kExitMarker)));
  } catch(const std::exception&) {
    return false;
  }
  return true;
}

std::vector<DeviceInfo> AdbBridge::list_devices() {
  try {
    AdbSocket socket(options_.host, options_.port);
    socket.connect(options_.connect_timeout);
    socket.send_request("host:devices-l", options_.command_timeout);
    socket.expect_okay(options_.command_timeout);
    auto text = socket.read_length_prefixed(options_.command_timeout);
    note_success();
    return parse_device_list(text);
  } catch(const AdbTimeout& e) {
    note_timeout(std::string("device listing: ") + e.what());
  } catch(const AdbFailure& e) {
    logger_->error("device listing failed: {}", e.what());
  }
  return {};
}

std::vector<std::string> AdbBridge::device_features(const std::string& serial) {
  {
    std::lock_guard lg(features_mutex_);
    auto it = features_.find(serial);
    if(it != features_.end()) return it->second;
  }
  std::vector<std::string> features;
  try {
    AdbSocket socket(options_.host, options_.port);
    socket.connect(options_.connect_timeout);
    socket.send_request("host-serial:" + serial + ":features", options_.command_timeout);
    socket.expect_okay(options_.command_timeout);
    features = split(socket.read_length_prefixed(options_.command_timeout), ',');
    note_success();
  } catch(const AdbTimeout& e) {
    note_timeout("feature query for " + serial + ": " + e.what());
    return features;
  } catch(const AdbFailure& e) {
    // Old servers do not know the request; treat as no optional features.
    logger_->debug("feature query for {} failed: {}", serial, e.what());
  }
  std::lock_guard lg(features_mutex_);
  features_[serial] = features;
  return features;
}

bool AdbBridge::has_feature(const std::string& serial, const std::string& feature) {
  auto features = device_features(serial);
  return std::find(features.begin(), features.end(), feature) != features.end();
}

ShellResult AdbBridge::shell(const std::string& serial,
                             const std::string& command,
                             std::chrono::milliseconds timeout) {
  ShellResult result;
  const bool shell_v2 = has_feature(serial, "shell_v2");
  const auto deadline = Clock::now() + timeout;
  try {
    AdbSocket socket(options_.host, options_.port);
    socket.connect(std::min(options_.connect_timeout, remaining(deadline)));
    socket.send_request("host:transport:" + serial, remaining(deadline));
    socket.expect_okay(remaining(deadline));

    if(shell_v2) {
      socket.send_request("shell,v2,raw:" + command, remaining(deadline));
      socket.expect_okay(remaining(deadline));
      std::array<char, 5> header{};
      std::vector<char> payload;
      bool exited = false;
      while(!exited) {
        socket.read_exact(header.data(), header.size(), remaining(deadline));
        auto length = get_le32(reinterpret_cast<const unsigned char*>(header.data() + 1));
        payload.resize(length);
        if(length > 0) socket.read_exact(payload.data(), length, remaining(deadline));
        switch(static_cast<uint8_t>(header[0])) {
          case kShellStdout:
            result.out.append(payload.data(), payload.size());
            break;
          case kShellStderr:
            result.err.append(payload.data(), payload.size());
            break;
          case kShellExit:
            result.exit_code = payload.empty() ? -1 : static_cast<uint8_t>(payload[0]);
            exited = true;
            break;
          default:
            break;
        }
      }
    } else {
      socket.send_request("shell:" + command + "; echo " + kExitMarker + "$?", remaining(deadline));
      socket.expect_okay(remaining(deadline));
      std::string raw;
      std::array<char, 4096> buffer{};
      for(;;) {
        auto n = socket.read_some(buffer.data(), buffer.size(), remaining(deadline));
        if(n == 0) break;
        raw.append(buffer.data(), n);
      }
      int exit_code = -1;
      if(!split_exit_marker(raw, result.out, exit_code)) {
        result.err = "shell exited without status";
      }
      result.exit_code = exit_code;
    }
    note_success();
  } catch(const AdbTimeout& e) {
    result.timed_out = true;
    result.err = e.what();
    note_timeout("shell on " + serial + " timed out: " + command);
  } catch(const AdbFailure& e) {
    result.exit_code = -1;
    result.err = e.what();
    logger_->debug("shell on {} failed: {}", serial, e.what());
  }
  return result;
}

bool AdbBridge::test_path(const std::string& serial, const std::string& path, PathTest mode) {
  const auto quoted = shell_quote(path);
  std::string command;
  switch(mode) {
    case PathTest::Exists:
      command = "test -e " + quoted;
      break;
    case PathTest::Directory:
      command = "test -d " + quoted;
      break;
    case PathTest::File:
      command = "test -f " + quoted;
      break;
    case PathTest::Writable: {
      // `test -w` is unreliable on emulated storage, so directories get a real write.
      const auto probe = shell_quote(path + "/.onboard_write_probe");
      command = "if [ -d " + quoted + " ]; then touch " + probe + " && rm -f " + probe +
                "; else test -w " + quoted + "; fi";
      break;
    }
  }
  return shell(serial, command, options_.command_timeout).ok();
}

bool AdbBridge::make_dirs(const std::string& serial, const std::string& path) {
  auto result = shell(serial, "mkdir -p " + shell_quote(path), options_.command_timeout);
  if(!result.ok()) {
    logger_->debug("mkdir -p {} on {} failed: {}", path, serial, result.err.empty() ? result.out : result.err);
  }
  return result.ok();
}

bool AdbBridge::remove_path(const std::string& serial, const std::string& path) {
  return shell(serial, "rm -rf " + shell_quote(path), options_.command_timeout).ok();
}

bool AdbBridge::push(const std::string& serial,
                     const std::string& local_path,
                     const std::string& remote_path,
                     std::string& error) {
  error.clear();
  std::ifstream in(local_path, std::ios::binary);
  if(!in) {
    error = "cannot open " + local_path;
    return false;
  }
  std::error_code ec;
  auto mtime = std::filesystem::last_write_time(local_path, ec);
  uint32_t mtime_seconds = 0;
  if(!ec) {
    // file_clock epoch is unspecified in C++17; shift through system_clock.
    auto as_system = std::chrono::time_point_cast<std::chrono::seconds>(
      mtime - decltype(mtime)::clock::now() + std::chrono::system_clock::now());
    mtime_seconds = static_cast<uint32_t>(as_system.time_since_epoch().count());
  }

  const auto timeout = options_.push_timeout;
  try {
    AdbSocket socket(options_.host, options_.port);
    socket.connect(options_.connect_timeout);
    socket.send_request("host:transport:" + serial, options_.command_timeout);
    socket.expect_okay(options_.command_timeout);
    socket.send_request("sync:", options_.command_timeout);
    socket.expect_okay(options_.command_timeout);

    std::string spec = remote_path + "," + std::to_string(kPushMode);
    socket.write_all(sync_header(kIdSend, static_cast<uint32_t>(spec.size())) + spec, timeout);

    std::vector<char> chunk(kSyncDataMax);
    while(in) {
      in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
      auto n = static_cast<std::size_t>(in.gcount());
      if(n == 0) break;
      socket.write_all(sync_header(kIdData, static_cast<uint32_t>(n)), timeout);
      socket.write_all(chunk.data(), n, timeout);
    }
    if(in.bad()) {
      error = "read error on " + local_path;
      return false;
    }
    socket.write_all(sync_header(kIdDone, mtime_seconds), timeout);

    std::array<char, 8> reply{};
    socket.read_exact(reply.data(), reply.size(), timeout);
    auto id = get_le32(reinterpret_cast<const unsigned char*>(reply.data()));
    auto length = get_le32(reinterpret_cast<const unsigned char*>(reply.data() + 4));
    if(id == kIdFail) {
      error = socket.read_string(length, timeout);
      note_success();
      return false;
    }
    if(id != kIdOkay) {
      error = "unexpected sync reply";
      return false;
    }
    socket.write_all(sync_header(kIdQuit, 0), options_.command_timeout);
    note_success();
    return true;
  } catch(const AdbTimeout& e) {
    error = std::string("push timed out: ") + e.what();
    note_timeout("push of " + local_path + " to " + serial + " timed out");
  } catch(const AdbFailure& e) {
    error = e.what();
  }
  return false;
}

std::optional<std::vector<RemoteEntry>> AdbBridge::list_directory(const std::string& serial,
                                                                  const std::string& path) {
  const auto timeout = options_.command_timeout;
  try {
    AdbSocket socket(options_.host, options_.port);
    socket.connect(options_.connect_timeout);
    socket.send_request("host:transport:" + serial, timeout);
    socket.expect_okay(timeout);
    socket.send_request("sync:", timeout);
    socket.expect_okay(timeout);
    socket.write_all(sync_header(kIdList, static_cast<uint32_t>(path.size())) + path, timeout);

    std::vector<RemoteEntry> entries;
    std::array<char, 20> header{};
    for(;;) {
      socket.read_exact(header.data(), header.size(), timeout);
      auto* raw = reinterpret_cast<const unsigned char*>(header.data());
      auto id = get_le32(raw);
      if(id == kIdDone) break;
      if(id == kIdFail) {
        auto length = get_le32(raw + 4);
        std::string message = socket.read_string(length, timeout);
        logger_->debug("listing {} on {} failed: {}", path, serial, message);
        return std::nullopt;
      }
      if(id != kIdDent) throw AdbFailure("unexpected listing record");
      auto mode = get_le32(raw + 4);
      auto size = get_le32(raw + 8);
      auto name_length = get_le32(raw + 16);
      auto name = socket.read_string(name_length, timeout);
      if(name == "." || name == "..") continue;
      entries.push_back(RemoteEntry{name, size, (mode & kModeTypeMask) == kModeDirectory});
    }
    socket.write_all(sync_header(kIdQuit, 0), timeout);
    note_success();
    return entries;
  } catch(const AdbTimeout& e) {
    note_timeout("listing " + path + " on " + serial + ": " + e.what());
  } catch(const AdbFailure& e) {
    logger_->debug("listing {} on {} failed: {}", path, serial, e.what());
  }
  return std::nullopt;
}
