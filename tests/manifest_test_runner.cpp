#include "adb_bridge.hpp"
#include "command_line_parser.hpp"
#include "content_client.hpp"
#include "device_bridge.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "manifest.hpp"
#include "progress_tracker.hpp"
#include "settings_manager.hpp"

#include "test_runner_utils.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace {

using onboard::test::TempWorkspace;
using onboard::test::TestCase;
using onboard::test::TestContext;
using onboard::test::write_file;
using onboard::test::write_json;

nlohmann::json complete_video(const std::string& id) {
  return nlohmann::json{
    {"id", id},
    {"title", "Film " + id},
    {"description", ""},
    {"thumbnailKey", "thumb_" + id + ".jpg"},
    {"thumbnailUrl", "https://cdn.example.com/thumb_" + id + ".jpg"},
    {"fileKeyLow", "lowres_" + id + ".mp4"},
    {"fileKey", "highres_" + id + ".mp4"},
    {"fileUrlLow", "https://cdn.example.com/lowres_" + id + ".mp4"},
    {"fileUrl", "https://cdn.example.com/highres_" + id + ".mp4"},
    {"isActive", true},
    {"tags", nlohmann::json::array()}};
}

ErrorKind parse_error_kind(const nlohmann::json& doc) {
  try {
    parse_manifest(doc);
  } catch(const OnboardError& e) {
    return e.kind();
  }
  return ErrorKind::None;
}

bool test_manifest_parses_videos_and_tags(TestContext&) {
  nlohmann::json doc{
    {"lastModified", "03/04/2025 09:15:00"},
    {"videos", nlohmann::json::array({complete_video("12")})},
    {"tags", nlohmann::json::array({
      nlohmann::json{{"id", 4}, {"name", "Sea"}, {"imageUrl", "https://cdn.example.com/tags/sea.jpg"}},
      nlohmann::json{{"id", 5}, {"name", "Forest"}, {"imageUrl", ""}}})}};
  auto manifest = parse_manifest(doc);
  return manifest.last_modified == "03/04/2025 09:15:00" &&
         manifest.videos.size() == 1 &&
         manifest.videos[0].id == "12" &&
         manifest.videos[0].low_res_key == "lowres_12.mp4" &&
         manifest.videos[0].thumbnail_url == "https://cdn.example.com/thumb_12.jpg" &&
         manifest.tags.size() == 2 &&
         manifest.tags[0].id == "4" &&
         manifest.tags[0].image_url == std::optional<std::string>("https://cdn.example.com/tags/sea.jpg") &&
         !manifest.tags[1].image_url.has_value();
}

bool test_manifest_rejects_unusable_entries(TestContext&) {
  auto missing_low = nlohmann::json{{"videos", nlohmann::json::array({complete_video("1")})}};
  missing_low["videos"][0].erase("fileKeyLow");

  auto empty_url = nlohmann::json{{"videos", nlohmann::json::array({complete_video("1")})}};
  empty_url["videos"][0]["thumbnailUrl"] = "";

  auto nested_key = nlohmann::json{{"videos", nlohmann::json::array({complete_video("1")})}};
  nested_key["videos"][0]["fileKey"] = "sub/highres.mp4";

  auto bare_tag = nlohmann::json{{"tags", nlohmann::json::array({
    nlohmann::json{{"id", "t"}, {"imageUrl", "https://cdn.example.com"}}})}};

  auto videos_object = nlohmann::json{{"videos", nlohmann::json::object()}};

  return parse_error_kind(missing_low) == ErrorKind::ManifestInvalid &&
         parse_error_kind(empty_url) == ErrorKind::ManifestInvalid &&
         parse_error_kind(nested_key) == ErrorKind::ManifestInvalid &&
         parse_error_kind(bare_tag) == ErrorKind::ManifestInvalid &&
         parse_error_kind(videos_object) == ErrorKind::ManifestInvalid &&
         parse_error_kind(nlohmann::json::object()) == ErrorKind::None;
}

bool test_manifest_file_loading(TestContext&) {
  TempWorkspace ws("manifest_load");
  write_json(ws / "new_data.json", nlohmann::json{
    {"lastModified", "x"},
    {"videos", nlohmann::json::array({complete_video("3")})},
    {"tags", nlohmann::json::array()}});
  write_file(ws / "broken.json", "[1, 2");

  auto manifest = load_manifest(ws / "new_data.json");
  auto kind_of = [](const std::filesystem::path& path) {
    try {
      load_manifest(path);
    } catch(const OnboardError& e) {
      return e.kind();
    }
    return ErrorKind::None;
  };
  return manifest.videos.size() == 1 &&
         kind_of(ws / "broken.json") == ErrorKind::ManifestInvalid &&
         kind_of(ws / "absent.json") == ErrorKind::ManifestInvalid;
}

bool test_manifest_validation_messages(TestContext&) {
  auto video = complete_video("1");
  video.erase("title");
  video.erase("isActive");
  nlohmann::json doc{
    {"lastModified", "x"},
    {"videos", nlohmann::json::array({complete_video("0"), video})},
    {"tags", nlohmann::json::array({nlohmann::json{{"id", "t1"}}})}};
  auto issues = validate_manifest_json(doc);

  nlohmann::json no_tags{{"lastModified", "x"}, {"videos", nlohmann::json::array()}};
  auto missing_key = validate_manifest_json(no_tags);

  return issues.size() == 2 &&
         issues[0] == "Video 1: Missing key: title, Missing key: isActive" &&
         issues[1] == "Tag 0: Missing key: name" &&
         missing_key == std::vector<std::string>{"Missing required key: tags"} &&
         validate_manifest_json(nlohmann::json::array()).size() == 1;
}

bool test_tag_image_file_names(TestContext&) {
  return tag_image_filename("https://cdn.example.com/tags/sea.jpg") == "sea.jpg" &&
         tag_image_filename("https://cdn.example.com/tags/sea.jpg?size=large#top") == "sea.jpg" &&
         tag_image_filename("https://cdn.example.com/a/b/") == "b" &&
         tag_image_filename("https://cdn.example.com").empty() &&
         tag_image_filename("https://cdn.example.com/..").empty() &&
         is_safe_filename("lowres_1.mp4") &&
         !is_safe_filename("..") &&
         !is_safe_filename("a\\b") &&
         !is_safe_filename("");
}

bool test_manifest_built_from_backend_payload(TestContext&) {
  nlohmann::json films{{"films", nlohmann::json::array({
    nlohmann::json{
      {"id", 7},
      {"title", "Harbour"},
      {"thumbnailKey", "thumb_7.jpg"},
      {"thumbnailUrl", "https://cdn.example.com/thumb_7.jpg"},
      {"lowQualityFileKey", "lowres_7.mp4"},
      {"lowQualityFileUrl", "https://cdn.example.com/lowres_7.mp4"},
      {"fileKey", "highres_7.mp4"},
      {"fileUrl", "https://cdn.example.com/highres_7.mp4"},
      {"tags", nlohmann::json::array({"sea"})}}})}};
  nlohmann::json tags = nlohmann::json::array({nlohmann::json{{"id", "sea"}, {"name", "Sea"}}});

  auto doc = build_manifest_json(films, tags, "05/06/2025 12:00:00");
  auto manifest = parse_manifest(doc);

  bool rejects_bad_input = false;
  try {
    build_manifest_json(films, nlohmann::json::object(), "x");
  } catch(const std::invalid_argument&) {
    rejects_bad_input = true;
  }
  auto stamp = manifest_timestamp_now();
  return validate_manifest_json(doc).empty() &&
         doc["videos"][0]["id"] == "7" &&
         doc["videos"][0]["isActive"] == true &&
         doc["videos"][0]["description"] == "" &&
         manifest.videos[0].low_res_url == "https://cdn.example.com/lowres_7.mp4" &&
         manifest.tags.size() == 1 &&
         rejects_bad_input &&
         stamp.size() == 19 && stamp[2] == '/' && stamp[5] == '/' && stamp[13] == ':';
}

bool test_settings_defaults_validate(TestContext&) {
  SettingsManager settings;
  auto defaults = validate_settings(settings);
  auto with_login = validate_settings(settings, true);

  std::string error;
  settings.set_from_string("quality", "ultra", error);
  settings.set_from_string("conflict_policy", "merge", error);
  settings.set_from_string("api_url", "api.example.com", error);
  settings.set_from_string("adb_port", "70000", error);
  auto broken = validate_settings(settings);
  auto mentions = [&](const std::string& needle) {
    return std::any_of(broken.begin(), broken.end(),
      [&](const std::string& issue){ return issue.find(needle) != std::string::npos; });
  };
  return defaults.empty() &&
         with_login == std::vector<std::string>{"email is required"} &&
         broken.size() == 4 &&
         mentions("quality") && mentions("conflict_policy") &&
         mentions("api_url") && mentions("adb_port") &&
         settings.get<std::vector<std::string>>("fallback_paths").size() == 5;
}

bool test_settings_persist_only_persistent_keys(TestContext&) {
  TempWorkspace ws("settings");
  auto path = ws / "nested/config.json";
  {
    SettingsManager settings;
    settings.set_settings_path(path);
    std::string error;
    settings.set_from_string("email", "crew@example.com", error);
    settings.set_from_string("password", "secret", error);
    settings.set_from_string("master_serial", "PHONE1", error);
    settings.set_from_string("videos_only", "true", error);
    if(!settings.save()) return false;
  }
  SettingsManager loaded;
  loaded.set_settings_path(path);
  bool ok = loaded.load();
  std::string error;
  bool rejected = !loaded.set_from_string("retry_attempts", "many", error) && !error.empty();
  bool unknown = !loaded.set_from_string("no_such_setting", "1", error);
  return ok &&
         loaded.get<std::string>("email") == "crew@example.com" &&
         loaded.get<std::string>("master_serial") == "PHONE1" &&
         loaded.get<std::string>("password").empty() &&
         !loaded.get<bool>("videos_only") &&
         rejected && unknown;
}

bool test_command_line_options(TestContext&) {
  CommandLineParser parser("onboard");
  SettingsManager settings;
  std::string error;
  bool parsed = parser.parse({"transfer", "--master", "PHONE1", "-slave", "HEADSET2",
                              "--videos-only", "--retries", "5", "--allow_root", "false",
                              "--fallback_paths", "[\"/sdcard/X\"]"},
                             settings, error);
  return parsed && error.empty() &&
         settings.get<std::string>("command") == "transfer" &&
         settings.get<std::string>("master_serial") == "PHONE1" &&
         settings.get<std::string>("slave_serial") == "HEADSET2" &&
         settings.get<bool>("videos_only") &&
         settings.get<int>("retry_attempts") == 5 &&
         !settings.get<bool>("allow_root") &&
         settings.get<std::vector<std::string>>("fallback_paths") == std::vector<std::string>{"/sdcard/X"};
}

bool test_command_line_errors(TestContext&) {
  CommandLineParser parser("onboard");
  auto fails_with = [&](const std::vector<std::string>& args, const std::string& needle) {
    SettingsManager settings;
    std::string error;
    return !parser.parse(args, settings, error) && error.find(needle) != std::string::npos;
  };
  SettingsManager flags;
  std::string error;
  bool bool_then_command = parser.parse({"--verbose", "download"}, flags, error) &&
                           flags.get<bool>("verbose") &&
                           flags.get<std::string>("command") == "download";
  return fails_with({"--bogus"}, "Unknown option") &&
         fails_with({"--retries"}, "Missing value") &&
         fails_with({"--retries", "several"}, "Invalid value") &&
         fails_with({"deploy", "extra"}, "Unexpected positional") &&
         bool_then_command;
}

bool test_http_url_parsing(TestContext&) {
  auto api = parse_http_url("https://api.example.com/integration/films?page=2#top");
  auto local = parse_http_url("http://[::1]:8080");
  auto with_user = parse_http_url("http://user:pw@cdn.example.com:81/a.mp4");
  return api && api->host == "api.example.com" && api->port == "443" && api->tls() &&
         api->default_port() && api->target == "/integration/films?page=2" &&
         local && local->host == "::1" && local->port == "8080" && local->target == "/" &&
         !local->default_port() &&
         with_user && with_user->host == "cdn.example.com" && with_user->port == "81" &&
         !parse_http_url("ftp://example.com/file") &&
         !parse_http_url("http://host:abc/") &&
         !parse_http_url("example.com/path");
}

bool test_http_response_head(TestContext&) {
  HttpResponseHead ok;
  bool parsed = parse_response_head("HTTP/1.1 200 OK\r\nContent-Length: 12\r\nX-Trace: abc\r\n", ok);
  HttpResponseHead chunked;
  bool chunked_parsed = parse_response_head(
    "HTTP/1.1 302 Found\r\nTransfer-Encoding: chunked\r\nContent-Length: 5\r\nLocation: /next\r\n", chunked);
  HttpResponseHead garbage;
  return parsed && ok.status == 200 && ok.reason == "OK" &&
         ok.content_length == std::optional<uint64_t>(12) &&
         ok.header("x-trace") == std::optional<std::string>("abc") &&
         chunked_parsed && chunked.chunked && !chunked.content_length &&
         chunked.location == "/next" &&
         !parse_response_head("SSH-2.0-OpenSSH", garbage) &&
         HttpClient::retryable_status(503) && HttpClient::retryable_status(429) &&
         !HttpClient::retryable_status(404);
}

bool test_chunked_decoding(TestContext&) {
  const std::string wire = "4\r\nWiki\r\n5;name=value\r\npedia\r\n0\r\nX-Tail: 1\r\n\r\n";
  std::string whole;
  ChunkedDecoder at_once;
  bool ok = at_once.feed(wire.data(), wire.size(),
    [&](const char* data, std::size_t size){ whole.append(data, size); return true; });

  std::string bytewise;
  ChunkedDecoder split;
  bool split_ok = true;
  for(char c : wire) {
    split_ok = split_ok && split.feed(&c, 1,
      [&](const char* data, std::size_t size){ bytewise.append(data, size); return true; });
  }

  ChunkedDecoder bad;
  const std::string malformed = "zz\r\n";
  bool rejected = !bad.feed(malformed.data(), malformed.size(), nullptr);
  return ok && at_once.done() && whole == "Wikipedia" &&
         split_ok && split.done() && bytewise == "Wikipedia" &&
         rejected;
}

bool test_adb_device_listing(TestContext&) {
  auto devices = AdbBridge::parse_device_list(
    "List of devices attached\n"
    "* daemon started successfully\n"
    "1WMHH8123 device usb:1-1 product:hollywood model:Quest_2 device:hollywood transport_id:3\r\n"
    "R58N12AB unauthorized usb:1-2 transport_id:4\n"
    "\n");
  return devices.size() == 2 &&
         devices[0].serial == "1WMHH8123" && devices[0].online() &&
         devices[0].model == "Quest_2" && devices[0].product == "hollywood" &&
         devices[1].status == "unauthorized" && !devices[1].online() &&
         devices[1].model == "Unknown";
}

bool test_adb_shell_exit_marker(TestContext&) {
  std::string output;
  int code = -1;
  bool found = AdbBridge::split_exit_marker("line one\n__ONBOARD_EXIT__:3\n", output, code);
  std::string plain;
  int untouched = 42;
  bool missing = AdbBridge::split_exit_marker("no marker here", plain, untouched);
  return found && output == "line one\n" && code == 3 &&
         !missing && plain == "no marker here" && untouched == 42 &&
         shell_quote("/sdcard/it's here") == "'/sdcard/it'\\''s here'";
}

bool test_backend_envelopes(TestContext&) {
  nlohmann::json login{{"success", true}, {"data", {{"success", true}, {"accessToken", "tok-1"}}}};
  nlohmann::json inner_failure{{"success", true}, {"data", {{"success", false}, {"accessToken", "tok-1"}}}};
  nlohmann::json outer_failure{{"success", false}, {"data", {{"success", true}, {"accessToken", "tok-1"}}}};
  nlohmann::json no_token{{"success", true}, {"data", {{"success", true}}}};
  nlohmann::json tags{{"success", true}, {"data", nlohmann::json::array({1, 2})}};
  nlohmann::json string_flag{{"success", "true"}, {"data", nlohmann::json::array()}};

  auto payload = ContentClient::unwrap_payload(tags);
  return ContentClient::extract_access_token(login) == std::optional<std::string>("tok-1") &&
         !ContentClient::extract_access_token(inner_failure) &&
         !ContentClient::extract_access_token(outer_failure) &&
         !ContentClient::extract_access_token(no_token) &&
         payload && payload->is_array() && payload->size() == 2 &&
         !ContentClient::unwrap_payload(nlohmann::json{{"success", true}}) &&
         !ContentClient::unwrap_payload(string_flag);
}

bool test_percent_and_labels(TestContext&) {
  return percent_complete(1, 4) == std::optional<double>(25.0) &&
         !percent_complete(3, std::nullopt) &&
         !percent_complete(3, 0) &&
         std::string(transfer_status_label(TransferStatus::InProgress)) == "in_progress" &&
         std::string(asset_class_label(AssetClass::Json)) == "json" &&
         std::string(error_kind_label(ErrorKind::NoWritablePath)) == "no_writable_path";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"manifest_parses_videos_and_tags", test_manifest_parses_videos_and_tags},
    {"manifest_rejects_unusable_entries", test_manifest_rejects_unusable_entries},
    {"manifest_file_loading", test_manifest_file_loading},
    {"manifest_validation_messages", test_manifest_validation_messages},
    {"tag_image_file_names", test_tag_image_file_names},
    {"manifest_built_from_backend_payload", test_manifest_built_from_backend_payload},
    {"settings_defaults_validate", test_settings_defaults_validate},
    {"settings_persist_only_persistent_keys", test_settings_persist_only_persistent_keys},
    {"command_line_options", test_command_line_options},
    {"command_line_errors", test_command_line_errors},
    {"http_url_parsing", test_http_url_parsing},
    {"http_response_head", test_http_response_head},
    {"chunked_decoding", test_chunked_decoding},
    {"adb_device_listing", test_adb_device_listing},
    {"adb_shell_exit_marker", test_adb_shell_exit_marker},
    {"backend_envelopes", test_backend_envelopes},
    {"percent_and_labels", test_percent_and_labels},
  };
  return onboard::test::run_test_cases("manifest", tests, argc, argv);
}
