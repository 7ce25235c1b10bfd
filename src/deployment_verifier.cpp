#include "deployment_verifier.hpp"

#include <cctype>
#include <sstream>

#include "local_file_set.hpp"

DeploymentVerifier::DeploymentVerifier(std::shared_ptr<DeviceBridge> bridge,
                                       Options options,
                                       std::shared_ptr<Logger> logger)
  : bridge_(std::move(bridge)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("verify")) {}

bool DeploymentVerifier::locate(DeviceTarget& device) {
  std::optional<std::string> existing;
  for(const auto& path : options_.search_paths) {
    if(bridge_->test_path(device.serial, path + "/" + kManifestFileName, PathTest::File)) {
      device.set_base_path(path);
      return true;
    }
    if(!existing && bridge_->test_path(device.serial, path, PathTest::Directory)) {
      existing = path;
    }
  }
  if(existing) {
    device.set_base_path(*existing);
    return true;
  }
  return false;
}

std::optional<std::size_t> DeploymentVerifier::parse_count(const std::string& text) {
  std::istringstream in(text);
  std::string token;
  if(!(in >> token)) return std::nullopt;
  for(char c : token) {
    if(!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
  }
  try {
    return static_cast<std::size_t>(std::stoull(token));
  } catch(const std::exception&) {
    return std::nullopt;
  }
}

std::optional<StorageInfo> DeploymentVerifier::parse_storage(const std::string& du_output,
                                                             const std::string& df_output) {
  StorageInfo info;
  bool any = false;
  {
    std::istringstream in(du_output);
    std::string size;
    if(in >> size) {
      info.used_space = size;
      any = true;
    }
  }
  {
    std::istringstream in(df_output);
    std::string header;
    std::string line;
    std::getline(in, header);
    if(std::getline(in, line)) {
      std::istringstream fields(line);
      std::vector<std::string> parts;
      std::string part;
      while(fields >> part) parts.push_back(part);
      if(parts.size() >= 4) {
        info.total_space = parts[1];
        info.available_space = parts[3];
        any = true;
      }
    }
  }
  if(!any) return std::nullopt;
  return info;
}

std::optional<StorageInfo> DeploymentVerifier::storage_info(const DeviceTarget& device) {
  auto du = bridge_->shell(device.serial, "du -sh " + shell_quote(device.base_path), options_.timeout);
  auto df = bridge_->shell(device.serial, "df " + shell_quote(options_.storage_root), options_.timeout);
  return parse_storage(du.ok() ? du.out : std::string(), df.ok() ? df.out : std::string());
}

std::size_t DeploymentVerifier::count_files(const DeviceTarget& device,
                                            const std::string& dir,
                                            bool videos_only) {
  if(auto listing = bridge_->list_directory(device.serial, dir)) {
    std::size_t count = 0;
    for(const auto& entry : *listing) {
      if(entry.is_directory) continue;
      if(videos_only && !is_video_file(entry.name)) continue;
      ++count;
    }
    return count;
  }
  std::string command = "find " + shell_quote(dir) +
                        (videos_only ? " -name '*.mp4'" : " -type f") + " | wc -l";
  auto result = bridge_->shell(device.serial, command, options_.timeout);
  if(!result.ok()) {
    logger_->debug("{}: cannot count files in {}", device.serial, dir);
    return 0;
  }
  return parse_count(result.out).value_or(0);
}

bool DeploymentVerifier::write_probe(const DeviceTarget& device) {
  const auto probe = shell_quote(device.base_path + "/.onboard_verify_probe");
  auto result = bridge_->shell(device.serial, "touch " + probe + " && rm -f " + probe, options_.timeout);
  return result.ok();
}

DeploymentReport DeploymentVerifier::inspect(DeviceTarget& device) {
  DeploymentReport report;
  report.serial = device.serial;
  report.role = device.role;
  if(device.base_path.empty() && !locate(device)) {
    logger_->warn("{}: no deployment directory found", device.serial);
    return report;
  }
  report.base_path = device.base_path;
  report.json_exists = bridge_->test_path(device.serial, device.base_path + "/" + kManifestFileName, PathTest::File);
  report.credential_exists = bridge_->test_path(device.serial, device.base_path + "/" + kCredentialFileName, PathTest::File);
  report.video_count = count_files(device, device.video_path, true);
  report.image_count = count_files(device, device.image_path, false);
  report.storage = storage_info(device);
  logger_->debug("{}: json={} videos={} images={}", device.serial, report.json_exists,
                 report.video_count, report.image_count);
  return report;
}
