#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

struct HttpUrl {
  std::string scheme;   // "http" or "https"
  std::string host;
  std::string port;
  std::string target;   // path plus query, at least "/"

  bool tls() const { return scheme == "https"; }
  bool default_port() const { return port == (tls() ? "443" : "80"); }
};

std::optional<HttpUrl> parse_http_url(const std::string& url);

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResponseHead {
  int status = 0;
  std::string reason;
  HttpHeaders headers;
  std::optional<uint64_t> content_length;
  bool chunked = false;
  std::string location;

  std::optional<std::string> header(const std::string& name) const;
};

// Parses the status line and headers, without the terminating blank line.
bool parse_response_head(const std::string& text, HttpResponseHead& head);

// Incremental decoder for Transfer-Encoding: chunked.
class ChunkedDecoder {
public:
  using Sink = std::function<bool(const char* data, std::size_t size)>;

  // Returns false when the stream is malformed or the sink refused data.
  bool feed(const char* data, std::size_t size, const Sink& sink);
  bool done() const { return state_ == State::Done; }

private:
  enum class State { Size, Data, DataEnd, Trailer, Done };

  State state_ = State::Size;
  uint64_t remaining_ = 0;
  std::string pending_;
};

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  HttpHeaders headers;
  std::string body;
};

struct HttpResult {
  bool success = false;     // 2xx with the complete body delivered
  bool retryable = false;   // transport failure, timeout, 408, 429 or 5xx
  int status = 0;
  std::string error;
  std::string body;         // collected when no body callback is given
  uint64_t bytes = 0;
};

class HttpClient {
public:
  struct Options {
    std::chrono::milliseconds timeout{60000};   // per connect/read/write step
    int max_redirects = 5;
    std::string user_agent = "onboard/1.0";
    bool verify_peer = true;
  };

  using HeadCallback = std::function<void(const HttpResponseHead&)>;
  using BodyCallback = std::function<bool(const char* data, std::size_t size)>;

  explicit HttpClient(Options options, std::shared_ptr<Logger> logger = nullptr);

  HttpResult request(const HttpRequest& request,
                     const HeadCallback& on_head = {},
                     const BodyCallback& on_body = {}) const;
  HttpResult get(const std::string& url, const HttpHeaders& headers = {}) const;
  HttpResult post_json(const std::string& url,
                       const nlohmann::json& body,
                       const HttpHeaders& headers = {}) const;

  const Options& options() const { return options_; }

  static bool retryable_status(int status);

private:
  HttpResult perform_once(const HttpRequest& request,
                          const HttpUrl& url,
                          const HeadCallback& on_head,
                          const BodyCallback& on_body,
                          std::string& redirect_to) const;

  Options options_;
  std::shared_ptr<Logger> logger_;
};
