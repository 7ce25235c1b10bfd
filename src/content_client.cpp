#include "content_client.hpp"

#include <fstream>
#include <system_error>

#include "local_file_set.hpp"
#include "manifest.hpp"

namespace {

std::optional<nlohmann::json> parse_body(const std::string& body) {
  auto doc = nlohmann::json::parse(body, nullptr, false);
  if(doc.is_discarded()) return std::nullopt;
  return doc;
}

bool success_flag(const nlohmann::json& doc) {
  return doc.is_object() && doc.contains("success") && doc.at("success").is_boolean() &&
         doc.at("success").get<bool>();
}

} // namespace

ContentClient::ContentClient(std::shared_ptr<const HttpClient> http,
                             Options options,
                             std::shared_ptr<Logger> logger)
  : http_(std::move(http)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("content")) {}

std::optional<std::string> ContentClient::extract_access_token(const nlohmann::json& response) {
  auto data = unwrap_payload(response);
  if(!data || !success_flag(*data)) return std::nullopt;
  auto it = data->find("accessToken");
  if(it == data->end() || !it->is_string()) return std::nullopt;
  auto token = it->get<std::string>();
  if(token.empty()) return std::nullopt;
  return token;
}

std::optional<nlohmann::json> ContentClient::unwrap_payload(const nlohmann::json& response) {
  if(!success_flag(response) || !response.contains("data")) return std::nullopt;
  return response.at("data");
}

HttpHeaders ContentClient::headers() const {
  HttpHeaders result{{"Accept", "application/json"}};
  if(!access_token_.empty()) {
    result.emplace_back("Authorization", "Bearer " + access_token_);
  }
  return result;
}

bool ContentClient::authenticate(const std::string& email, const std::string& password) {
  access_token_.clear();
  auto url = options_.api_url + options_.auth_endpoint;
  auto result = http_->post_json(url, nlohmann::json{{"email", email}, {"password", password}}, headers());
  if(!result.success) {
    logger_->error("Authentication request failed: {}", result.error.empty()
                   ? "HTTP " + std::to_string(result.status) : result.error);
    return false;
  }
  auto doc = parse_body(result.body);
  if(!doc) {
    logger_->error("Authentication response is not JSON");
    return false;
  }
  auto token = extract_access_token(*doc);
  if(!token) {
    logger_->error("Authentication rejected for {}", email);
    return false;
  }
  access_token_ = *token;
  logger_->info("Authenticated as {}", email);
  return true;
}

std::optional<nlohmann::json> ContentClient::get_payload(const std::string& endpoint, const char* what) {
  if(!authenticated()) {
    logger_->error("Not authenticated, cannot fetch {}", what);
    return std::nullopt;
  }
  auto result = http_->get(options_.api_url + endpoint, headers());
  if(!result.success) {
    logger_->error("Fetching {} failed: {}", what, result.error.empty()
                   ? "HTTP " + std::to_string(result.status) : result.error);
    return std::nullopt;
  }
  auto doc = parse_body(result.body);
  if(!doc) {
    logger_->error("{} response is not JSON", what);
    return std::nullopt;
  }
  auto payload = unwrap_payload(*doc);
  if(!payload) logger_->error("{} response reported failure", what);
  return payload;
}

std::optional<nlohmann::json> ContentClient::fetch_tags() {
  auto tags = get_payload(options_.tags_endpoint, "tags");
  if(tags && !tags->is_array()) {
    logger_->error("tags payload is not a list");
    return std::nullopt;
  }
  if(tags) logger_->info("Retrieved {} tags", tags->size());
  return tags;
}

std::optional<nlohmann::json> ContentClient::fetch_films() {
  auto films = get_payload(options_.films_endpoint, "films");
  if(films && !films->is_object()) {
    logger_->error("films payload is not an object");
    return std::nullopt;
  }
  if(films) {
    auto count = films->contains("films") ? films->at("films").size() : 0;
    logger_->info("Retrieved {} films", count);
  }
  return films;
}

std::optional<nlohmann::json> ContentClient::write_manifest(const std::filesystem::path& downloads_root) {
  auto tags = fetch_tags();
  if(!tags) return std::nullopt;
  auto films = fetch_films();
  if(!films) return std::nullopt;

  nlohmann::json doc;
  try {
    doc = build_manifest_json(*films, *tags, manifest_timestamp_now());
  } catch(const std::exception& e) {
    logger_->error("Cannot build {}: {}", kManifestFileName, e.what());
    return std::nullopt;
  }
  for(const auto& issue : validate_manifest_json(doc)) {
    logger_->warn("{}: {}", kManifestFileName, issue);
  }

  std::error_code ec;
  std::filesystem::create_directories(downloads_root, ec);
  auto path = downloads_root / kManifestFileName;
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    logger_->error("Cannot write {}", path.string());
    return std::nullopt;
  }
  out << doc.dump(2);
  out.close();
  if(!out) {
    logger_->error("Cannot write {}", path.string());
    return std::nullopt;
  }
  logger_->info("Wrote {} with {} videos and {} tags", path.string(),
                doc.at("videos").size(), doc.at("tags").size());
  return doc;
}
