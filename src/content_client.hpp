#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "http_client.hpp"
#include "log.hpp"

// Talks to the content backend: login, then the tag and film listings that
// new_data.json is built from.
class ContentClient {
public:
  struct Options {
    std::string api_url = "https://api.eldersvr.com";
    std::string auth_endpoint = "/integration/auth/login";
    std::string tags_endpoint = "/integration/tags";
    std::string films_endpoint = "/integration/films";
  };

  ContentClient(std::shared_ptr<const HttpClient> http,
                Options options,
                std::shared_ptr<Logger> logger = nullptr);

  bool authenticate(const std::string& email, const std::string& password);
  bool authenticated() const { return !access_token_.empty(); }

  std::optional<nlohmann::json> fetch_tags();
  std::optional<nlohmann::json> fetch_films();

  // Fetches tags and films and writes <root>/new_data.json. Returns the
  // written document.
  std::optional<nlohmann::json> write_manifest(const std::filesystem::path& downloads_root);

  // {"success":true,"data":{"success":true,"accessToken":"..."}} -> token.
  static std::optional<std::string> extract_access_token(const nlohmann::json& response);
  // {"success":true,"data":X} -> X.
  static std::optional<nlohmann::json> unwrap_payload(const nlohmann::json& response);

private:
  std::optional<nlohmann::json> get_payload(const std::string& endpoint, const char* what);
  HttpHeaders headers() const;

  std::shared_ptr<const HttpClient> http_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::string access_token_;
};
