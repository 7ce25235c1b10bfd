#include "http_client.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace {

using asio::ip::tcp;

constexpr std::size_t kMaxHeadBytes = 64 * 1024;
constexpr std::size_t kMaxErrorBody = 4096;
constexpr std::size_t kReadBufferSize = 8192;

struct TransportTimeout : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct TransportError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string trim(const std::string& value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if(begin == std::string::npos) return std::string();
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

// Plain TCP or TLS connection with per-step timeouts; same run_for pattern
// as the adb socket.
class Transport {
public:
  Transport(const HttpUrl& url, bool verify_peer)
    : url_(url), verify_peer_(verify_peer), ssl_context_(asio::ssl::context::tls_client) {}

  ~Transport() {
    std::error_code ignored;
    lowest().close(ignored);
  }

  void connect(std::chrono::milliseconds timeout) {
    std::error_code ec;
    tcp::resolver resolver(io_);
    auto endpoints = resolver.resolve(url_.host, url_.port, ec);
    if(ec) throw TransportError("cannot resolve " + url_.host + ": " + ec.message());

    if(url_.tls()) {
      ssl_context_.set_default_verify_paths(ec);
      tls_ = std::make_unique<asio::ssl::stream<tcp::socket>>(io_, ssl_context_);
      if(verify_peer_) {
        tls_->set_verify_mode(asio::ssl::verify_peer);
        tls_->set_verify_callback(asio::ssl::host_name_verification(url_.host));
      } else {
        tls_->set_verify_mode(asio::ssl::verify_none);
      }
      if(!SSL_set_tlsext_host_name(tls_->native_handle(), url_.host.c_str())) {
        throw TransportError("cannot set TLS server name for " + url_.host);
      }
    }

    std::error_code result = asio::error::would_block;
    asio::async_connect(lowest(), endpoints,
      [&](const std::error_code& error, const tcp::endpoint&){ result = error; });
    wait(timeout, "connect");
    if(result) throw TransportError("connect to " + url_.host + " failed: " + result.message());

    if(tls_) {
      result = asio::error::would_block;
      tls_->async_handshake(asio::ssl::stream_base::client,
        [&](const std::error_code& error){ result = error; });
      wait(timeout, "TLS handshake");
      if(result) throw TransportError("TLS handshake with " + url_.host + " failed: " + result.message());
    }
  }

  void write_all(const std::string& data, std::chrono::milliseconds timeout) {
    std::error_code result = asio::error::would_block;
    auto handler = [&](const std::error_code& error, std::size_t){ result = error; };
    if(tls_) {
      asio::async_write(*tls_, asio::buffer(data), handler);
    } else {
      asio::async_write(lowest(), asio::buffer(data), handler);
    }
    wait(timeout, "write");
    if(result) throw TransportError("write failed: " + result.message());
  }

  // Returns 0 at end of stream.
  std::size_t read_some(char* data, std::size_t size, std::chrono::milliseconds timeout) {
    std::error_code result = asio::error::would_block;
    std::size_t transferred = 0;
    auto handler = [&](const std::error_code& error, std::size_t n){ result = error; transferred = n; };
    if(tls_) {
      tls_->async_read_some(asio::buffer(data, size), handler);
    } else {
      lowest().async_read_some(asio::buffer(data, size), handler);
    }
    wait(timeout, "read");
    if(result == asio::error::eof) return 0;
    // Many servers close TLS without close_notify once the body is complete.
    if(result == asio::ssl::error::stream_truncated) return 0;
    if(result) throw TransportError("read failed: " + result.message());
    return transferred;
  }

private:
  tcp::socket::lowest_layer_type& lowest() {
    if(tls_) return tls_->lowest_layer();
    return plain_;
  }

  void wait(std::chrono::milliseconds timeout, const char* what) {
    io_.restart();
    io_.run_for(timeout);
    if(!io_.stopped()) {
      std::error_code ignored;
      lowest().close(ignored);
      io_.run();
      throw TransportTimeout(std::string(what) + " to " + url_.host + " timed out");
    }
  }

  HttpUrl url_;
  bool verify_peer_;
  asio::io_context io_;
  asio::ssl::context ssl_context_;
  tcp::socket plain_{io_};
  std::unique_ptr<asio::ssl::stream<tcp::socket>> tls_;
};

std::string resolve_location(const HttpUrl& base, const std::string& location) {
  if(location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) return location;
  std::string origin = base.scheme + "://" + base.host;
  if(!base.default_port()) origin += ":" + base.port;
  if(!location.empty() && location.front() == '/') return origin + location;
  auto slash = base.target.rfind('/', base.target.find('?'));
  std::string directory = (slash == std::string::npos) ? "/" : base.target.substr(0, slash + 1);
  return origin + directory + location;
}

bool is_redirect(int status) {
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

} // namespace

std::optional<HttpUrl> parse_http_url(const std::string& url) {
  HttpUrl out;
  auto scheme_end = url.find("://");
  if(scheme_end == std::string::npos) return std::nullopt;
  out.scheme = lower(url.substr(0, scheme_end));
  if(out.scheme != "http" && out.scheme != "https") return std::nullopt;

  auto authority_begin = scheme_end + 3;
  auto path_begin = url.find_first_of("/?#", authority_begin);
  std::string authority = url.substr(authority_begin, path_begin == std::string::npos
                                                      ? std::string::npos
                                                      : path_begin - authority_begin);
  auto at = authority.rfind('@');
  if(at != std::string::npos) authority = authority.substr(at + 1);
  if(authority.empty()) return std::nullopt;

  if(authority.front() == '[') {
    auto close = authority.find(']');
    if(close == std::string::npos) return std::nullopt;
    out.host = authority.substr(1, close - 1);
    if(close + 1 < authority.size() && authority[close + 1] == ':') {
      out.port = authority.substr(close + 2);
    }
  } else {
    auto colon = authority.rfind(':');
    if(colon != std::string::npos) {
      out.host = authority.substr(0, colon);
      out.port = authority.substr(colon + 1);
    } else {
      out.host = authority;
    }
  }
  if(out.host.empty()) return std::nullopt;
  if(out.port.empty()) out.port = out.tls() ? "443" : "80";
  if(!std::all_of(out.port.begin(), out.port.end(), [](unsigned char c){ return std::isdigit(c); })) {
    return std::nullopt;
  }

  out.target = path_begin == std::string::npos ? "/" : url.substr(path_begin);
  auto fragment = out.target.find('#');
  if(fragment != std::string::npos) out.target.erase(fragment);
  if(out.target.empty() || out.target.front() != '/') out.target.insert(0, "/");
  return out;
}

std::optional<std::string> HttpResponseHead::header(const std::string& name) const {
  auto wanted = lower(name);
  for(const auto& [key, value] : headers) {
    if(lower(key) == wanted) return value;
  }
  return std::nullopt;
}

bool parse_response_head(const std::string& text, HttpResponseHead& head) {
  std::istringstream lines(text);
  std::string line;
  if(!std::getline(lines, line)) return false;
  if(!line.empty() && line.back() == '\r') line.pop_back();
  if(line.rfind("HTTP/", 0) != 0) return false;

  auto first_space = line.find(' ');
  if(first_space == std::string::npos) return false;
  auto second_space = line.find(' ', first_space + 1);
  try {
    head.status = std::stoi(line.substr(first_space + 1, second_space - first_space - 1));
  } catch(const std::exception&) {
    return false;
  }
  head.reason = second_space == std::string::npos ? std::string() : line.substr(second_space + 1);

  while(std::getline(lines, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(line.empty()) break;
    auto colon = line.find(':');
    if(colon == std::string::npos) continue;
    std::string key = trim(line.substr(0, colon));
    std::string value = trim(line.substr(colon + 1));
    auto lowered = lower(key);
    if(lowered == "content-length") {
      try {
        head.content_length = std::stoull(value);
      } catch(const std::exception&) {
        return false;
      }
    } else if(lowered == "transfer-encoding") {
      head.chunked = lower(value).find("chunked") != std::string::npos;
    } else if(lowered == "location") {
      head.location = value;
    }
    head.headers.emplace_back(std::move(key), std::move(value));
  }
  // Content-Length is meaningless alongside chunked framing.
  if(head.chunked) head.content_length.reset();
  return true;
}

bool ChunkedDecoder::feed(const char* data, std::size_t size, const Sink& sink) {
  pending_.append(data, size);
  for(;;) {
    switch(state_) {
      case State::Size: {
        auto eol = pending_.find("\r\n");
        if(eol == std::string::npos) return pending_.size() <= 1024;
        std::string line = pending_.substr(0, eol);
        auto extension = line.find(';');
        if(extension != std::string::npos) line.erase(extension);
        line = trim(line);
        if(line.empty()) return false;
        try {
          remaining_ = std::stoull(line, nullptr, 16);
        } catch(const std::exception&) {
          return false;
        }
        pending_.erase(0, eol + 2);
        state_ = remaining_ == 0 ? State::Trailer : State::Data;
        break;
      }
      case State::Data: {
        if(pending_.empty()) return true;
        auto take = static_cast<std::size_t>(std::min<uint64_t>(remaining_, pending_.size()));
        if(sink && !sink(pending_.data(), take)) return false;
        pending_.erase(0, take);
        remaining_ -= take;
        if(remaining_ == 0) state_ = State::DataEnd;
        break;
      }
      case State::DataEnd:
        if(pending_.size() < 2) return true;
        if(pending_.compare(0, 2, "\r\n") != 0) return false;
        pending_.erase(0, 2);
        state_ = State::Size;
        break;
      case State::Trailer: {
        auto eol = pending_.find("\r\n");
        if(eol == std::string::npos) return pending_.size() <= kMaxHeadBytes;
        pending_.erase(0, eol + 2);
        if(eol == 0) state_ = State::Done;
        break;
      }
      case State::Done:
        pending_.clear();
        return true;
    }
  }
}

HttpClient::HttpClient(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("http")) {}

bool HttpClient::retryable_status(int status) {
  return status == 408 || status == 429 || status >= 500;
}

HttpResult HttpClient::request(const HttpRequest& request,
                               const HeadCallback& on_head,
                               const BodyCallback& on_body) const {
  HttpRequest current = request;
  for(int hop = 0; hop <= options_.max_redirects; ++hop) {
    auto url = parse_http_url(current.url);
    if(!url) {
      HttpResult result;
      result.error = "invalid URL: " + current.url;
      return result;
    }
    std::string redirect_to;
    auto result = perform_once(current, *url, on_head, on_body, redirect_to);
    if(redirect_to.empty()) return result;

    logger_->debug("{} redirected to {}", current.url, redirect_to);
    if(result.status == 303) {
      current.method = "GET";
      current.body.clear();
    }
    current.url = resolve_location(*url, redirect_to);
  }
  HttpResult result;
  result.error = "too many redirects for " + request.url;
  return result;
}

HttpResult HttpClient::get(const std::string& url, const HttpHeaders& headers) const {
  HttpRequest request;
  request.url = url;
  request.headers = headers;
  return this->request(request);
}

HttpResult HttpClient::post_json(const std::string& url,
                                 const nlohmann::json& body,
                                 const HttpHeaders& headers) const {
  HttpRequest request;
  request.method = "POST";
  request.url = url;
  request.headers = headers;
  request.headers.emplace_back("Content-Type", "application/json");
  request.body = body.dump();
  return this->request(request);
}

HttpResult HttpClient::perform_once(const HttpRequest& request,
                                    const HttpUrl& url,
                                    const HeadCallback& on_head,
                                    const BodyCallback& on_body,
                                    std::string& redirect_to) const {
  HttpResult result;
  try {
    Transport transport(url, options_.verify_peer);
    transport.connect(options_.timeout);

    std::ostringstream head_out;
    head_out << request.method << ' ' << url.target << " HTTP/1.1\r\n";
    head_out << "Host: " << url.host;
    if(!url.default_port()) head_out << ':' << url.port;
    head_out << "\r\n";
    head_out << "User-Agent: " << options_.user_agent << "\r\n";
    head_out << "Accept: */*\r\n";
    head_out << "Connection: close\r\n";
    for(const auto& [key, value] : request.headers) {
      head_out << key << ": " << value << "\r\n";
    }
    if(!request.body.empty() || request.method == "POST" || request.method == "PUT") {
      head_out << "Content-Length: " << request.body.size() << "\r\n";
    }
    head_out << "\r\n";
    transport.write_all(head_out.str() + request.body, options_.timeout);

    std::array<char, kReadBufferSize> buffer{};
    std::string raw;
    std::size_t head_end = std::string::npos;
    while(head_end == std::string::npos) {
      auto n = transport.read_some(buffer.data(), buffer.size(), options_.timeout);
      if(n == 0) throw TransportError("connection closed before response headers");
      raw.append(buffer.data(), n);
      head_end = raw.find("\r\n\r\n");
      if(head_end == std::string::npos && raw.size() > kMaxHeadBytes) {
        throw TransportError("response headers too large");
      }
    }

    HttpResponseHead head;
    if(!parse_response_head(raw.substr(0, head_end), head)) {
      throw TransportError("malformed response from " + url.host);
    }
    result.status = head.status;
    std::string leftover = raw.substr(head_end + 4);

    if(is_redirect(head.status) && !head.location.empty()) {
      redirect_to = head.location;
      return result;
    }

    const bool ok_status = head.status >= 200 && head.status < 300;
    if(ok_status && on_head) on_head(head);

    bool sink_refused = false;
    auto deliver = [&](const char* data, std::size_t size) -> bool {
      result.bytes += size;
      if(ok_status && on_body) {
        if(!on_body(data, size)) {
          sink_refused = true;
          return false;
        }
        return true;
      }
      if(result.body.size() < (ok_status ? std::string::npos : kMaxErrorBody)) {
        result.body.append(data, size);
      }
      return true;
    };

    const bool no_body = request.method == "HEAD" || head.status == 204 || head.status == 304 ||
                         (head.status >= 100 && head.status < 200);
    bool complete = no_body;
    if(!no_body && head.chunked) {
      ChunkedDecoder decoder;
      bool good = decoder.feed(leftover.data(), leftover.size(), deliver);
      while(good && !decoder.done()) {
        auto n = transport.read_some(buffer.data(), buffer.size(), options_.timeout);
        if(n == 0) break;
        good = decoder.feed(buffer.data(), n, deliver);
      }
      if(!good && !sink_refused) throw TransportError("malformed chunked body");
      complete = decoder.done();
    } else if(!no_body && head.content_length) {
      const uint64_t expected = *head.content_length;
      uint64_t received = 0;
      auto take = [&](const char* data, std::size_t size) {
        auto use = static_cast<std::size_t>(std::min<uint64_t>(size, expected - received));
        received += use;
        return use == 0 || deliver(data, use);
      };
      bool good = take(leftover.data(), leftover.size());
      while(good && received < expected) {
        auto n = transport.read_some(buffer.data(), buffer.size(), options_.timeout);
        if(n == 0) break;
        good = take(buffer.data(), n);
      }
      complete = received == expected;
    } else if(!no_body) {
      bool good = leftover.empty() || deliver(leftover.data(), leftover.size());
      while(good) {
        auto n = transport.read_some(buffer.data(), buffer.size(), options_.timeout);
        if(n == 0) break;
        good = deliver(buffer.data(), n);
      }
      complete = good;
    }

    if(sink_refused) {
      result.error = "local write failed";
      return result;
    }
    if(!complete) {
      result.error = "connection closed before the full body arrived";
      result.retryable = true;
      return result;
    }
    if(!ok_status) {
      result.error = "HTTP " + std::to_string(head.status) +
                     (head.reason.empty() ? std::string() : " " + head.reason);
      result.retryable = retryable_status(head.status);
      return result;
    }
    result.success = true;
  } catch(const TransportTimeout& e) {
    result.error = e.what();
    result.retryable = true;
  } catch(const TransportError& e) {
    result.error = e.what();
    result.retryable = true;
  } catch(const std::system_error& e) {
    result.error = e.what();
    result.retryable = true;
  }
  return result;
}
