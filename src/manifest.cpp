#include "manifest.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "errors.hpp"

namespace {

std::string json_to_text(const nlohmann::json& value) {
  if(value.is_string()) return value.get<std::string>();
  if(value.is_null()) return std::string();
  return value.dump();
}

std::string required_field(const nlohmann::json& entry,
                           const char* key,
                           const std::string& context) {
  if(!entry.contains(key) || entry.at(key).is_null()) {
    throw OnboardError(ErrorKind::ManifestInvalid, context + " is missing '" + key + "'");
  }
  auto text = json_to_text(entry.at(key));
  if(text.empty()) {
    throw OnboardError(ErrorKind::ManifestInvalid, context + " has empty '" + key + "'");
  }
  return text;
}

std::string required_file_key(const nlohmann::json& entry,
                              const char* key,
                              const std::string& context) {
  auto name = required_field(entry, key, context);
  if(!is_safe_filename(name)) {
    throw OnboardError(ErrorKind::ManifestInvalid,
                       context + " has unusable file name '" + name + "' in '" + key + "'");
  }
  return name;
}

void append_missing(const nlohmann::json& entry,
                    std::initializer_list<const char*> keys,
                    std::vector<std::string>& missing) {
  for(const char* key : keys) {
    if(!entry.is_object() || !entry.contains(key)) {
      missing.push_back(std::string("Missing key: ") + key);
    }
  }
}

std::string join(const std::vector<std::string>& parts, const char* separator) {
  std::ostringstream out;
  for(std::size_t i = 0; i < parts.size(); ++i) {
    if(i > 0) out << separator;
    out << parts[i];
  }
  return out.str();
}

} // namespace

bool is_safe_filename(const std::string& name) {
  if(name.empty() || name == "." || name == "..") return false;
  if(name.find('/') != std::string::npos || name.find('\\') != std::string::npos) return false;
  if(name.find('\0') != std::string::npos) return false;
  return true;
}

std::string tag_image_filename(const std::string& url) {
  auto end = url.find_first_of("?#");
  std::string path = url.substr(0, end);
  while(!path.empty() && path.back() == '/') path.pop_back();
  auto slash = path.rfind('/');
  std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
  // "https://host" has no path segment at all
  if(slash != std::string::npos && slash > 0 && path[slash - 1] == '/') return std::string();
  return is_safe_filename(name) ? name : std::string();
}

AssetManifest parse_manifest(const nlohmann::json& doc) {
  if(!doc.is_object()) {
    throw OnboardError(ErrorKind::ManifestInvalid, "manifest is not a JSON object");
  }
  AssetManifest manifest;
  manifest.last_modified = doc.contains("lastModified") ? json_to_text(doc.at("lastModified")) : std::string();

  if(doc.contains("videos")) {
    const auto& videos = doc.at("videos");
    if(!videos.is_array()) {
      throw OnboardError(ErrorKind::ManifestInvalid, "'videos' is not an array");
    }
    for(std::size_t i = 0; i < videos.size(); ++i) {
      const auto& entry = videos[i];
      std::string context = "video " + std::to_string(i);
      if(!entry.is_object()) {
        throw OnboardError(ErrorKind::ManifestInvalid, context + " is not an object");
      }
      VideoAsset video;
      video.id = required_field(entry, "id", context);
      context += " (id " + video.id + ")";
      video.title = entry.contains("title") ? json_to_text(entry.at("title")) : std::string();
      video.high_res_key = required_file_key(entry, "fileKey", context);
      video.high_res_url = required_field(entry, "fileUrl", context);
      video.low_res_key = required_file_key(entry, "fileKeyLow", context);
      video.low_res_url = required_field(entry, "fileUrlLow", context);
      video.thumbnail_key = required_file_key(entry, "thumbnailKey", context);
      video.thumbnail_url = required_field(entry, "thumbnailUrl", context);
      if(entry.contains("tags") && entry.at("tags").is_array()) {
        for(const auto& tag : entry.at("tags")) {
          video.tags.push_back(json_to_text(tag));
        }
      }
      manifest.videos.push_back(std::move(video));
    }
  }

  if(doc.contains("tags")) {
    const auto& tags = doc.at("tags");
    if(!tags.is_array()) {
      throw OnboardError(ErrorKind::ManifestInvalid, "'tags' is not an array");
    }
    for(std::size_t i = 0; i < tags.size(); ++i) {
      const auto& entry = tags[i];
      if(!entry.is_object()) {
        throw OnboardError(ErrorKind::ManifestInvalid, "tag " + std::to_string(i) + " is not an object");
      }
      TagAsset tag;
      tag.id = entry.contains("id") ? json_to_text(entry.at("id")) : std::string();
      tag.name = entry.contains("name") ? json_to_text(entry.at("name")) : std::string();
      if(entry.contains("imageUrl")) {
        auto url = json_to_text(entry.at("imageUrl"));
        if(!url.empty()) {
          if(tag_image_filename(url).empty()) {
            throw OnboardError(ErrorKind::ManifestInvalid,
                               "tag " + std::to_string(i) + " image URL has no file name: " + url);
          }
          tag.image_url = url;
        }
      }
      manifest.tags.push_back(std::move(tag));
    }
  }
  return manifest;
}

AssetManifest load_manifest(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) {
    throw OnboardError(ErrorKind::ManifestInvalid, "cannot open manifest " + path.string());
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw OnboardError(ErrorKind::ManifestInvalid,
                       "manifest " + path.string() + " is not valid JSON: " + e.what());
  }
  return parse_manifest(doc);
}

std::vector<std::string> validate_manifest_json(const nlohmann::json& doc) {
  std::vector<std::string> issues;
  if(!doc.is_object()) {
    issues.push_back("Manifest is not a JSON object");
    return issues;
  }
  for(const char* key : {"lastModified", "videos", "tags"}) {
    if(!doc.contains(key)) {
      issues.push_back(std::string("Missing required key: ") + key);
    }
  }
  if(doc.contains("videos") && doc.at("videos").is_array()) {
    const auto& videos = doc.at("videos");
    for(std::size_t i = 0; i < videos.size(); ++i) {
      std::vector<std::string> missing;
      append_missing(videos[i], {"id", "title", "description", "thumbnailKey", "thumbnailUrl",
                                 "fileKeyLow", "fileKey", "fileUrlLow", "fileUrl", "isActive", "tags"},
                     missing);
      if(!missing.empty()) {
        issues.push_back("Video " + std::to_string(i) + ": " + join(missing, ", "));
      }
    }
  }
  if(doc.contains("tags") && doc.at("tags").is_array()) {
    const auto& tags = doc.at("tags");
    for(std::size_t i = 0; i < tags.size(); ++i) {
      std::vector<std::string> missing;
      append_missing(tags[i], {"id", "name"}, missing);
      if(!missing.empty()) {
        issues.push_back("Tag " + std::to_string(i) + ": " + join(missing, ", "));
      }
    }
  }
  return issues;
}

nlohmann::json build_manifest_json(const nlohmann::json& films_data,
                                   const nlohmann::json& tags_data,
                                   const std::string& last_modified) {
  if(!films_data.is_object() || !tags_data.is_array()) {
    throw std::invalid_argument("films data and tags data are required");
  }
  nlohmann::json videos = nlohmann::json::array();
  if(films_data.contains("films")) {
    for(const auto& film : films_data.at("films")) {
      nlohmann::json video;
      video["id"] = json_to_text(film.at("id"));
      video["title"] = film.at("title");
      video["description"] = film.value("description", "");
      video["thumbnailKey"] = film.at("thumbnailKey");
      video["thumbnailUrl"] = film.at("thumbnailUrl");
      video["fileKeyLow"] = film.at("lowQualityFileKey");
      video["fileKey"] = film.at("fileKey");
      video["fileUrlLow"] = film.at("lowQualityFileUrl");
      video["fileUrl"] = film.at("fileUrl");
      video["isActive"] = film.value("isActive", true);
      video["tags"] = film.contains("tags") ? film.at("tags") : nlohmann::json::array();
      videos.push_back(std::move(video));
    }
  }
  return nlohmann::json{
    {"lastModified", last_modified},
    {"videos", std::move(videos)},
    {"tags", tags_data}
  };
}

std::string manifest_timestamp_now() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  std::ostringstream out;
  out << std::put_time(&local, "%m/%d/%Y %H:%M:%S");
  return out.str();
}
