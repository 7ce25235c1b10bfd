#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

#include "progress_tracker.hpp"
#include "storage_resolver.hpp"

inline constexpr const char* kManifestFileName = "new_data.json";
inline constexpr const char* kCredentialFileName = "credential.json";

// videos_only keeps all media (videos and images) and drops the JSON files;
// json_only keeps the JSON files alone.
struct TransferScope {
  bool videos_only = false;
  bool json_only = false;
  bool clean_remote = false;

  bool includes(AssetClass asset_class) const;
};

using FileMap = std::map<std::string, std::filesystem::path>;

// Files one device should receive, keyed by name within their target
// directory: json -> base, videos -> Video, images -> Image.
struct LocalFileSet {
  FileMap json;
  FileMap videos;
  FileMap images;

  const FileMap& at(AssetClass asset_class) const;
  std::size_t size() const { return json.size() + videos.size() + images.size(); }
  bool empty() const { return size() == 0; }
};

bool is_video_file(const std::string& name);
bool is_image_file(const std::string& name);

// Reads <root>/new_data.json, <root>/credential.json, <root>/videos and
// <root>/images. Masters get lowres_* videos and the credential file,
// slaves get highres_* videos.
LocalFileSet build_local_file_set(const std::filesystem::path& root,
                                  DeviceRole role,
                                  const TransferScope& scope);

uint64_t local_file_size(const std::filesystem::path& path);
