#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct VideoAsset {
  std::string id;
  std::string title;
  std::string high_res_key;
  std::string high_res_url;
  std::string low_res_key;
  std::string low_res_url;
  std::string thumbnail_key;
  std::string thumbnail_url;
  std::vector<std::string> tags;
};

struct TagAsset {
  std::string id;
  std::string name;
  std::optional<std::string> image_url;
};

struct AssetManifest {
  std::string last_modified;
  std::vector<VideoAsset> videos;
  std::vector<TagAsset> tags;
};

// Parses a new_data.json document. Throws OnboardError(ManifestInvalid) when
// a video lacks a key or URL, or when a file key could escape its directory.
AssetManifest parse_manifest(const nlohmann::json& doc);
AssetManifest load_manifest(const std::filesystem::path& path);

// Non-fatal structural problems, one line per offending entry.
std::vector<std::string> validate_manifest_json(const nlohmann::json& doc);

// File name a tag image is stored under: last URL path segment, query and
// fragment removed. Empty when the URL has no usable segment.
std::string tag_image_filename(const std::string& url);

// True when the name can be used as a single path component.
bool is_safe_filename(const std::string& name);

// Builds the new_data.json document from the backend's films payload (the
// object holding "films") and its tag list. Throws std::invalid_argument when
// either is missing.
nlohmann::json build_manifest_json(const nlohmann::json& films_data,
                                   const nlohmann::json& tags_data,
                                   const std::string& last_modified);

// "%m/%d/%Y %H:%M:%S" in local time, the stamp new_data.json carries.
std::string manifest_timestamp_now();
