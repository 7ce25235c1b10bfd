#pragma once

#include "log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <unistd.h>

namespace onboard::test {

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline void write_json(const std::filesystem::path& path, const nlohmann::json& content) {
  write_file(path, content.dump(2));
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Fresh directory under the system temp dir, removed again on destruction.
class TempWorkspace {
public:
  explicit TempWorkspace(const std::string& name) {
    static std::atomic<int> counter{0};
    root_ = std::filesystem::temp_directory_path() /
            ("onboard_" + name + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
  }

  ~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempWorkspace(const TempWorkspace&) = delete;
  TempWorkspace& operator=(const TempWorkspace&) = delete;

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path operator/(const std::string& relative) const { return root_ / relative; }

private:
  std::filesystem::path root_;
};

// Collects every record of the loggers it is attached to. Records are kept
// until clear(); listeners are removed again by detach_all().
class LogCapture {
public:
  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger, const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener([this, label](const LogRecord& record) {
      std::lock_guard lg(mutex_);
      LogRecord copy = record;
      if(!label.empty()) copy.component = label;
      records_.push_back(std::move(copy));
      return false;
    });
    std::lock_guard lg(mutex_);
    attached_.emplace_back(logger, handle);
  }

  void detach_all() {
    decltype(attached_) attached;
    {
      std::lock_guard lg(mutex_);
      attached.swap(attached_);
    }
    for(auto& [logger, handle] : attached) logger->remove_listener(handle);
  }

  void clear() {
    std::lock_guard lg(mutex_);
    records_.clear();
  }

  bool contains(const std::string& needle) const {
    std::lock_guard lg(mutex_);
    return std::any_of(records_.begin(), records_.end(),
      [&](const LogRecord& record){ return record.message.find(needle) != std::string::npos; });
  }

  void dump(std::ostream& out) const {
    std::lock_guard lg(mutex_);
    for(const auto& record : records_) {
      out << "    " << record.component << " [" << log_channel_label(record.channel) << "] "
          << record.message << "\n";
    }
  }

private:
  mutable std::mutex mutex_;
  std::vector<LogRecord> records_;
  std::vector<std::pair<std::shared_ptr<Logger>, LogListenerHandle>> attached_;
};

struct TestContext {
  LogCapture& logs;
  bool verbose = false;

  // Logger whose output lands in the capture, shown only for failing tests.
  std::shared_ptr<Logger> logger(const std::string& component) {
    auto result = std::make_shared<Logger>(component);
    logs.attach(result);
    return result;
  }
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Runs the cases whose name contains any non-flag argument (all when none is
// given), printing '.' or 'F' and the captured log of each failure.
// ONBOARD_TEST_VERBOSE or -v turns on verbose mode; ONBOARD_TEST_LOGS lets
// log output through to the console as it happens.
inline int run_test_cases(const char* suite,
                          const std::vector<TestCase>& tests,
                          int argc,
                          char** argv) {
  bool verbose = std::getenv("ONBOARD_TEST_VERBOSE") != nullptr;
  std::vector<std::string> filters;
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else {
      filters.push_back(arg);
    }
  }
  auto selected = [&](const TestCase& test) {
    if(filters.empty()) return true;
    return std::any_of(filters.begin(), filters.end(),
      [&](const std::string& filter){ return std::string(test.name).find(filter) != std::string::npos; });
  };

  const bool show_logs = verbose || std::getenv("ONBOARD_TEST_LOGS") != nullptr;
  init(verbose);
  set_log_passthrough(show_logs);

  LogCapture logs;
  TestContext ctx{logs, verbose};
  std::size_t ran = 0;
  std::vector<std::string> failed;
  const auto suite_start = std::chrono::steady_clock::now();
  std::cout << suite << ": " << std::flush;

  for(const auto& test : tests) {
    if(!selected(test)) continue;
    ++ran;
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      std::cerr << "\n" << test.name << " threw: " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
      continue;
    }
    std::cout << "F\n  " << test.name << " failed\n";
    logs.dump(std::cout);
    std::cout << suite << ": " << std::flush;
    failed.push_back(test.name);
  }

  set_log_passthrough(true);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - suite_start);
  std::cout << "\n";
  if(failed.empty()) {
    std::cout << "PASS (" << ran << " tests, " << elapsed.count() << " ms)\n";
    return 0;
  }
  std::cout << "FAIL (" << failed.size() << "/" << ran << " failed):";
  for(const auto& name : failed) std::cout << " " << name;
  std::cout << "\n";
  return 1;
}

} // namespace onboard::test
