#include "transfer_engine.hpp"

#include <algorithm>

namespace {

constexpr const char* kPlayerPackage = "com.q42.eldersvr";

} // namespace

ClassResult& TransferResult::at(AssetClass asset_class) {
  switch(asset_class) {
    case AssetClass::Json: return json;
    case AssetClass::Videos: return videos;
    case AssetClass::Images: break;
  }
  return images;
}

const ClassResult& TransferResult::at(AssetClass asset_class) const {
  return const_cast<TransferResult*>(this)->at(asset_class);
}

bool TransferResult::clean() const {
  if(device_failed()) return false;
  for(const auto* row : {&json, &videos, &images}) {
    if(row->status == TransferStatus::Failed || row->failed > 0) return false;
  }
  return true;
}

TransferEngine::TransferEngine(std::shared_ptr<DeviceBridge> bridge,
                               std::shared_ptr<StorageResolver> resolver,
                               Options options,
                               std::shared_ptr<ProgressTracker> progress,
                               std::shared_ptr<Logger> logger)
  : bridge_(std::move(bridge)),
    resolver_(std::move(resolver)),
    detector_(bridge_, logger),
    options_(std::move(options)),
    progress_(progress ? std::move(progress) : std::make_shared<ProgressTracker>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer")) {}

TransferResult TransferEngine::transfer(DeviceTarget& device,
                                        const TransferScope& scope,
                                        ConflictResolver& conflicts,
                                        const TransferProgressCallback& on_progress) {
  TransferSession session;
  TransferResult result;
  result.serial = device.serial;
  result.role = device.role;
  progress_->begin_device(device.serial, device_role_label(device.role));
  try {
    run(device, scope, conflicts, on_progress, session, result);
  } catch(const OnboardError& e) {
    fail_device(device, scope, result, e.kind(), e.what());
    throw;
  }
  return result;
}

void TransferEngine::set_status(const DeviceTarget& device,
                                TransferResult& result,
                                AssetClass asset_class,
                                TransferStatus status) {
  result.at(asset_class).status = status;
  progress_->set_class_status(device.serial, asset_class, status);
}

void TransferEngine::fail_device(const DeviceTarget& device,
                                 const TransferScope& scope,
                                 TransferResult& result,
                                 ErrorKind error,
                                 const std::string& detail) {
  result.error = error;
  result.detail = detail;
  for(auto asset_class : {AssetClass::Json, AssetClass::Videos, AssetClass::Images}) {
    if(!scope.includes(asset_class)) continue;
    if(result.at(asset_class).status == TransferStatus::Completed) continue;
    set_status(device, result, asset_class, TransferStatus::Failed);
  }
  logger_->error("{} ({}): {} [{}]", device.serial, device_role_label(device.role),
                 detail, error_kind_label(error));
}

bool TransferEngine::clean_remote(const DeviceTarget& device) {
  bool ok = true;
  for(const auto& path : {device.video_path, device.image_path,
                          device.base_path + "/" + kManifestFileName,
                          device.base_path + "/" + kCredentialFileName}) {
    if(!bridge_->remove_path(device.serial, path)) {
      logger_->warn("{}: could not remove {}", device.serial, path);
      ok = false;
    }
  }
  // resets the player's cached catalogue; fails harmlessly when the app is absent
  auto cleared = bridge_->shell(device.serial, "pm clear " + std::string(kPlayerPackage),
                                std::chrono::seconds(15));
  if(!cleared.ok()) {
    logger_->debug("{}: pm clear {} failed: {}", device.serial, kPlayerPackage, cleared.err);
  }
  return ok;
}

bool TransferEngine::prepare_directories(const DeviceTarget& device) {
  for(const auto& path : {device.base_path, device.video_path, device.image_path}) {
    if(!bridge_->make_dirs(device.serial, path)) {
      return false;
    }
  }
  return true;
}

void TransferEngine::run(DeviceTarget& device,
                         const TransferScope& scope,
                         ConflictResolver& conflicts,
                         const TransferProgressCallback& on_progress,
                         TransferSession& session,
                         TransferResult& result) {
  const auto& serial = device.serial;

  auto storage = resolver_->resolve(device);
  if(!storage.success) {
    fail_device(device, scope, result, ErrorKind::NoWritablePath, storage.detail);
    return;
  }
  result.base_path = device.base_path;
  logger_->info("{} ({}): transferring to {} [{}]", serial, device_role_label(device.role),
                device.base_path, storage_source_label(storage.source));

  if(scope.clean_remote && !clean_remote(device)) {
    logger_->warn("{}: previous content only partly removed", serial);
  }

  if(!prepare_directories(device)) {
    fail_device(device, scope, result, ErrorKind::DirectoryCreateFailed,
                "cannot create directory structure under " + device.base_path);
    return;
  }

  auto files = build_local_file_set(options_.downloads_root, device.role, scope);
  const bool manifest_missing = scope.includes(AssetClass::Json) &&
                                files.json.find(kManifestFileName) == files.json.end();
  for(auto asset_class : {AssetClass::Json, AssetClass::Videos, AssetClass::Images}) {
    if(!scope.includes(asset_class)) continue;
    auto total = files.at(asset_class).size();
    if(asset_class == AssetClass::Json && manifest_missing) ++total;
    result.at(asset_class).total = total;
    progress_->set_class_total(serial, asset_class, total);
  }

  auto report = detector_.check(device, files);
  if(report.has_conflicts()) {
    session.resolution = conflicts.request_resolution(device, report);
    switch(*session.resolution) {
      case ConflictResolution::Cancel:
        session.cancelled = true;
        fail_device(device, scope, result, ErrorKind::ConflictCancelled,
                    "transfer cancelled at conflict prompt");
        return;
      case ConflictResolution::SkipAll:
        for(const auto& conflict : report.conflicts) session.skipped.insert(conflict.filename);
        logger_->info("{}: skipping {} existing file(s)", serial, session.skipped.size());
        break;
      case ConflictResolution::OverrideAll:
        logger_->info("{}: overwriting {} existing file(s)", serial, report.conflicts.size());
        break;
    }
  }

  if(scope.includes(AssetClass::Json)) {
    std::vector<std::pair<std::string, std::filesystem::path>> ordered;
    auto manifest = files.json.find(kManifestFileName);
    if(manifest != files.json.end()) ordered.emplace_back(*manifest);
    auto credential = files.json.find(kCredentialFileName);
    if(credential != files.json.end()) ordered.emplace_back(*credential);
    if(manifest_missing) {
      auto& row = result.json;
      row.processed++;
      row.failed++;
      result.failed_files.push_back(kManifestFileName);
      logger_->error("{}: {} missing from {}", serial, kManifestFileName, options_.downloads_root.string());
    }
    push_class(device, AssetClass::Json, ordered, session, result, on_progress);
  }
  for(auto asset_class : {AssetClass::Videos, AssetClass::Images}) {
    if(!scope.includes(asset_class)) continue;
    const auto& class_files = files.at(asset_class);
    std::vector<std::pair<std::string, std::filesystem::path>> ordered(class_files.begin(), class_files.end());
    push_class(device, asset_class, ordered, session, result, on_progress);
  }
}

void TransferEngine::push_class(const DeviceTarget& device,
                                AssetClass asset_class,
                                const std::vector<std::pair<std::string, std::filesystem::path>>& files,
                                TransferSession& session,
                                TransferResult& result,
                                const TransferProgressCallback& on_progress) {
  auto& row = result.at(asset_class);
  const auto remote_dir = remote_directory_for(device, asset_class);
  set_status(device, result, asset_class, TransferStatus::InProgress);

  for(const auto& [name, path] : files) {
    if(cancel_requested_ || session.cancelled) {
      session.cancelled = true;
      result.detail = "transfer cancelled";
      break;
    }
    uint64_t pushed_bytes = 0;
    if(session.skipped.count(name)) {
      row.skipped++;
      logger_->debug("{}: skipped existing {}", device.serial, name);
    } else {
      std::string error;
      const auto size = local_file_size(path);
      if(bridge_->push(device.serial, path.string(), remote_dir + "/" + name, error)) {
        row.succeeded++;
        row.bytes += size;
        pushed_bytes = size;
      } else {
        row.failed++;
        result.failed_files.push_back(name);
        logger_->warn("{}: push of {} failed: {} [{}]", device.serial, name, error,
                      error_kind_label(ErrorKind::PushFailed));
      }
    }
    row.processed++;
    progress_->advance_class(device.serial, asset_class, row.processed, pushed_bytes);
    if(on_progress) on_progress(device.serial, asset_class, row.processed, row.total, name);
  }

  const bool complete = row.failed == 0 && row.processed == row.total;
  set_status(device, result, asset_class, complete ? TransferStatus::Completed : TransferStatus::Failed);
}
