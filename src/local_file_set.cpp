#include "local_file_set.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

bool has_extension(const std::string& name, std::initializer_list<const char*> extensions) {
  auto ext = lowercase(std::filesystem::path(name).extension().string());
  for(const char* candidate : extensions) {
    if(ext == candidate) return true;
  }
  return false;
}

void collect(const std::filesystem::path& dir, FileMap& out, bool (*accept)(const std::string&),
             const std::string& prefix = std::string()) {
  std::error_code ec;
  if(!std::filesystem::is_directory(dir, ec)) return;
  for(std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if(!it->is_regular_file(ec)) continue;
    auto name = it->path().filename().string();
    if(!accept(name)) continue;
    if(!prefix.empty() && name.rfind(prefix, 0) != 0) continue;
    out.emplace(name, std::filesystem::absolute(it->path(), ec));
  }
}

} // namespace

bool TransferScope::includes(AssetClass asset_class) const {
  if(!videos_only && !json_only) return true;
  switch(asset_class) {
    case AssetClass::Json: return json_only;
    case AssetClass::Videos: return videos_only;
    case AssetClass::Images: return !json_only;
  }
  return false;
}

const FileMap& LocalFileSet::at(AssetClass asset_class) const {
  switch(asset_class) {
    case AssetClass::Json: return json;
    case AssetClass::Videos: return videos;
    case AssetClass::Images: break;
  }
  return images;
}

bool is_video_file(const std::string& name) {
  return has_extension(name, {".mp4"});
}

bool is_image_file(const std::string& name) {
  return has_extension(name, {".jpg", ".jpeg", ".png", ".gif", ".webp"});
}

LocalFileSet build_local_file_set(const std::filesystem::path& root,
                                  DeviceRole role,
                                  const TransferScope& scope) {
  LocalFileSet files;
  std::error_code ec;
  if(scope.includes(AssetClass::Json)) {
    auto manifest = root / kManifestFileName;
    if(std::filesystem::is_regular_file(manifest, ec)) {
      files.json.emplace(kManifestFileName, std::filesystem::absolute(manifest, ec));
    }
    auto credential = root / kCredentialFileName;
    if(role == DeviceRole::Master && std::filesystem::is_regular_file(credential, ec)) {
      files.json.emplace(kCredentialFileName, std::filesystem::absolute(credential, ec));
    }
  }
  if(scope.includes(AssetClass::Videos)) {
    collect(root / "videos", files.videos, is_video_file,
            role == DeviceRole::Master ? "lowres_" : "highres_");
  }
  if(scope.includes(AssetClass::Images)) {
    collect(root / "images", files.images, is_image_file);
  }
  return files;
}

uint64_t local_file_size(const std::filesystem::path& path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<uint64_t>(size);
}
