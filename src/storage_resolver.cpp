#include "storage_resolver.hpp"

const char* device_role_label(DeviceRole role) {
  return role == DeviceRole::Master ? "master" : "slave";
}

const char* storage_source_label(StorageSource source) {
  switch(source) {
    case StorageSource::Primary: return "primary";
    case StorageSource::Elevated: return "elevated";
    case StorageSource::Fallback: return "fallback";
  }
  return "unknown";
}

DeviceTarget::DeviceTarget(std::string serial_in, DeviceRole role_in, const std::string& base)
  : serial(std::move(serial_in)), role(role_in) {
  set_base_path(base);
}

void DeviceTarget::set_base_path(const std::string& base) {
  base_path = base;
  while(base_path.size() > 1 && base_path.back() == '/') base_path.pop_back();
  video_path = base_path + "/Video";
  image_path = base_path + "/Image";
}

std::vector<std::string> default_fallback_paths() {
  return {
    "/storage/emulated/0/Android/data/com.q42.eldersvr/files/EldersVR",
    "/sdcard/EldersVR",
    "/storage/self/primary/EldersVR",
    "/mnt/sdcard/EldersVR",
    "/data/local/tmp/EldersVR"
  };
}

std::optional<bool> RootAccessCache::lookup(const std::string& serial) const {
  std::lock_guard lg(mutex_);
  auto it = entries_.find(serial);
  if(it == entries_.end()) return std::nullopt;
  return it->second;
}

void RootAccessCache::store(const std::string& serial, bool has_root) {
  std::lock_guard lg(mutex_);
  entries_.emplace(serial, has_root);
}

std::shared_ptr<RootAccessCache> RootAccessCache::shared() {
  static auto cache = std::make_shared<RootAccessCache>();
  return cache;
}

StorageResolver::StorageResolver(std::shared_ptr<DeviceBridge> bridge,
                                 Options options,
                                 std::shared_ptr<RootAccessCache> root_cache,
                                 std::shared_ptr<Logger> logger)
  : bridge_(std::move(bridge)),
    options_(std::move(options)),
    root_cache_(root_cache ? std::move(root_cache) : std::make_shared<RootAccessCache>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("storage")) {}

bool StorageResolver::usable(const std::string& serial, const std::string& path) {
  return bridge_->test_path(serial, path, PathTest::Directory) &&
         bridge_->test_path(serial, path, PathTest::Writable);
}

bool StorageResolver::has_root(const std::string& serial) {
  if(auto cached = root_cache_->lookup(serial)) return *cached;
  bool detected = detect_root(serial);
  root_cache_->store(serial, detected);
  return detected;
}

// `su` existing is not enough: some builds ship a stub that exits 0 without
// switching identity, so the reported uid decides.
bool StorageResolver::detect_root(const std::string& serial) {
  auto probe = bridge_->shell(serial, "command -v su", options_.probe_timeout);
  if(!probe.ok() || probe.out.find("su") == std::string::npos) {
    logger_->debug("{}: no su binary", serial);
    return false;
  }
  auto identity = bridge_->shell(serial, "su -c id", options_.probe_timeout);
  if(!identity.ok() || identity.out.find("uid=0") == std::string::npos) {
    logger_->debug("{}: su present but does not grant uid 0", serial);
    return false;
  }
  logger_->info("{}: root access available", serial);
  return true;
}

bool StorageResolver::escalate_primary(const std::string& serial) {
  const auto& path = options_.primary_path;
  auto inner = "mkdir -p " + shell_quote(path) + " && chmod 777 " + shell_quote(path);
  auto result = bridge_->shell(serial, "su -c " + shell_quote(inner), options_.probe_timeout);
  if(!result.ok()) {
    logger_->debug("{}: elevated mkdir of {} failed: {}", serial, path,
                   result.err.empty() ? result.out : result.err);
    return false;
  }
  return usable(serial, path);
}

StorageResolution StorageResolver::resolve(DeviceTarget& device) {
  StorageResolution resolution;
  const auto& serial = device.serial;

  if(usable(serial, options_.primary_path)) {
    resolution.success = true;
    resolution.base_path = options_.primary_path;
    resolution.source = StorageSource::Primary;
    device.set_base_path(resolution.base_path);
    logger_->debug("{}: using primary path {}", serial, resolution.base_path);
    return resolution;
  }

  if(options_.allow_root && has_root(serial)) {
    if(escalate_primary(serial)) {
      resolution.success = true;
      resolution.base_path = options_.primary_path;
      resolution.source = StorageSource::Elevated;
      device.set_base_path(resolution.base_path);
      logger_->info("{}: primary path made writable with root", serial);
      return resolution;
    }
    logger_->warn("{}: root available but primary path still not writable", serial);
  }

  for(const auto& candidate : options_.fallback_paths) {
    if(candidate.empty()) continue;
    if(!bridge_->make_dirs(serial, candidate)) {
      logger_->debug("{}: cannot create fallback {}", serial, candidate);
      continue;
    }
    if(!bridge_->test_path(serial, candidate, PathTest::Writable)) {
      logger_->debug("{}: fallback {} not writable", serial, candidate);
      continue;
    }
    resolution.success = true;
    resolution.base_path = candidate;
    resolution.source = StorageSource::Fallback;
    device.set_base_path(candidate);
    logger_->warn("{}: primary path unavailable, using fallback {}", serial, candidate);
    return resolution;
  }

  resolution.error = ErrorKind::NoWritablePath;
  resolution.detail = "no writable storage path on " + serial +
                      " (tried " + std::to_string(options_.fallback_paths.size() + 1) + " locations)";
  logger_->error("{}", resolution.detail);
  return resolution;
}
