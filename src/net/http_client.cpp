#include "agentwire/net/http_client.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <asio/ssl.hpp>
#include <cctype>
#include <regex>
#include <sstream>
#include <type_traits>

namespace agentwire::net {

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
  std::regex url_regex(R"(^(https?):\/\/([^:\/\s]+)(?::(\d+))?(\/[^\?\s]*)?(\?[^\s]*)?)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

std::string join_url(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  std::string out = base;
  while (!out.empty() && out.back() == '/') out.pop_back();
  size_t start = 0;
  while (start < path.size() && path[start] == '/') ++start;
  return out + "/" + path.substr(start);
}

std::string url_encode(const std::string& segment) {
  static const char hex[] = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : segment) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += hex[c >> 4];
      out += hex[c & 0x0F];
    }
  }
  return out;
}

bool ChunkedDecoder::feed(std::string_view in, std::string& out) {
  size_t i = 0;
  while (i < in.size() && state_ != State::Done) {
    switch (state_) {
      case State::Size: {
        char c = in[i++];
        if (c != '\n') {
          line_ += c;
          if (line_.size() > 1024) return false;
          break;
        }
        std::string size_str = line_.substr(0, line_.find_first_of(";\r"));
        line_.clear();
        try {
          size_t consumed = 0;
          remaining_ = std::stoul(size_str, &consumed, 16);
          if (consumed == 0) return false;
        } catch (const std::exception&) {
          return false;
        }
        state_ = remaining_ == 0 ? State::Trailer : State::Data;
        break;
      }
      case State::Data: {
        size_t n = std::min(remaining_, in.size() - i);
        out.append(in.substr(i, n));
        i += n;
        remaining_ -= n;
        if (remaining_ == 0) state_ = State::DataEnd;
        break;
      }
      case State::DataEnd: {
        char c = in[i++];
        if (c == '\n') {
          state_ = State::Size;
        } else if (c != '\r') {
          return false;
        }
        break;
      }
      case State::Trailer: {
        char c = in[i++];
        if (c == '\n') {
          if (line_.empty() || line_ == "\r") state_ = State::Done;
          line_.clear();
        } else {
          line_ += c;
        }
        break;
      }
      case State::Done:
        break;
    }
  }
  return true;
}

namespace {

using SslSocket = asio::ssl::stream<asio::ip::tcp::socket>;
using TcpSocket = asio::ip::tcp::socket;

constexpr size_t kMaxErrorBody = 64 * 1024;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r");
  return s.substr(start, end - start + 1);
}

// One request on its own socket. Every handler runs on the io_context thread.
template <typename Socket>
class StreamSession : public StreamCall, public std::enable_shared_from_this<StreamSession<Socket>> {
 public:
  StreamSession(asio::io_context& io_ctx, std::shared_ptr<Socket> socket, ParsedUrl url, HttpOptions options, StreamDataCallback on_data,
                StreamCompleteCallback on_complete)
      : io_ctx_(io_ctx),
        socket_(std::move(socket)),
        resolver_(io_ctx),
        timer_(io_ctx),
        url_(std::move(url)),
        options_(std::move(options)),
        on_data_(std::move(on_data)),
        on_complete_(std::move(on_complete)) {}

  void start() {
    request_ = build_request();

    if constexpr (std::is_same_v<Socket, SslSocket>) {
      SSL_set_tlsext_host_name(socket_->native_handle(), url_.host.c_str());
    }

    arm_timer(options_.connect_timeout);

    auto self = this->shared_from_this();
    resolver_.async_resolve(url_.host, url_.port_or_default(), [self](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
      if (self->finished_) return;
      if (ec) {
        self->fail("DNS resolution failed: " + ec.message());
        return;
      }
      asio::async_connect(self->socket_->lowest_layer(), results, [self](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
        if (self->finished_) return;
        if (ec) {
          self->fail("Connection failed: " + ec.message());
          return;
        }
        self->on_connected();
      });
    });
  }

  void cancel() override {
    auto self = this->shared_from_this();
    asio::post(io_ctx_, [self]() {
      if (self->finished_) return;
      spdlog::debug("Stream to {} cancelled", self->url_.host);
      self->result_.cancelled = true;
      self->complete();
    });
  }

 private:
  std::string build_request() const {
    std::ostringstream req;
    req << options_.method << " " << url_.path << url_.query << " HTTP/1.1\r\n";
    req << "Host: " << url_.host << "\r\n";
    req << "Connection: close\r\n";

    for (const auto& [key, value] : options_.headers) {
      req << key << ": " << value << "\r\n";
    }

    if (!options_.body.empty()) {
      req << "Content-Length: " << options_.body.size() << "\r\n";
    }

    req << "\r\n";
    req << options_.body;
    return req.str();
  }

  void arm_timer(std::chrono::milliseconds timeout) {
    timer_.expires_after(timeout);
    auto self = this->shared_from_this();
    timer_.async_wait([self](const asio::error_code& ec) {
      if (ec || self->finished_) return;
      self->result_.timed_out = true;
      self->fail("Request timed out");
    });
  }

  void on_connected() {
    if constexpr (std::is_same_v<Socket, SslSocket>) {
      auto self = this->shared_from_this();
      socket_->async_handshake(asio::ssl::stream_base::client, [self](const asio::error_code& ec) {
        if (self->finished_) return;
        if (ec) {
          self->fail("SSL handshake failed: " + ec.message());
          return;
        }
        self->write_request();
      });
    } else {
      write_request();
    }
  }

  void write_request() {
    auto self = this->shared_from_this();
    asio::async_write(*socket_, asio::buffer(request_), [self](const asio::error_code& ec, size_t) {
      if (self->finished_) return;
      if (ec) {
        self->fail("Write failed: " + ec.message());
        return;
      }
      self->read_headers();
    });
  }

  void read_headers() {
    auto self = this->shared_from_this();
    asio::async_read_until(*socket_, buffer_, "\r\n\r\n", [self](const asio::error_code& ec, size_t header_bytes) {
      if (self->finished_) return;
      if (ec) {
        self->fail("Read headers failed: " + ec.message());
        return;
      }
      if (!self->parse_headers(header_bytes)) {
        self->fail("Invalid HTTP response: cannot parse status line");
        return;
      }

      std::string leftover(asio::buffers_begin(self->buffer_.data()), asio::buffers_end(self->buffer_.data()));
      self->buffer_.consume(self->buffer_.size());
      if (!leftover.empty()) {
        self->process_body(leftover);
        if (self->finished_) return;
      }
      self->read_body();
    });
  }

  bool parse_headers(size_t header_bytes) {
    std::string head(asio::buffers_begin(buffer_.data()), asio::buffers_begin(buffer_.data()) + static_cast<std::ptrdiff_t>(header_bytes));
    buffer_.consume(header_bytes);

    std::istringstream stream(head);
    std::string status_line;
    std::getline(stream, status_line);

    std::regex status_regex(R"(HTTP/[\d.]+ (\d+))");
    std::smatch match;
    if (!std::regex_search(status_line, match, status_regex)) {
      return false;
    }
    result_.status_code = std::stoi(match[1].str());

    std::string line;
    while (std::getline(stream, line) && line != "\r" && !line.empty()) {
      auto colon = line.find(':');
      if (colon == std::string::npos) continue;
      result_.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    if (auto it = result_.headers.find("transfer-encoding"); it != result_.headers.end()) {
      chunked_ = to_lower(it->second).find("chunked") != std::string::npos;
    }
    if (auto it = result_.headers.find("content-length"); it != result_.headers.end() && !chunked_) {
      try {
        content_length_ = std::stoull(it->second);
      } catch (const std::exception&) {
        content_length_.reset();
      }
    }

    spdlog::debug("HTTP {} from {}{} (chunked={})", result_.status_code, url_.host, url_.path, chunked_);
    return true;
  }

  void read_body() {
    if (content_length_ && received_ >= *content_length_) {
      complete();
      return;
    }

    arm_timer(options_.read_timeout);

    auto self = this->shared_from_this();
    asio::async_read(*socket_, buffer_, asio::transfer_at_least(1), [self](const asio::error_code& ec, size_t) {
      if (self->finished_) return;

      bool is_eof = (ec == asio::error::eof) || (ec.category() == asio::error::get_ssl_category()) || ec == asio::ssl::error::stream_truncated;

      if (self->buffer_.size() > 0) {
        std::string chunk(asio::buffers_begin(self->buffer_.data()), asio::buffers_end(self->buffer_.data()));
        self->buffer_.consume(self->buffer_.size());
        self->process_body(chunk);
        if (self->finished_) return;
      }

      if (ec && !is_eof) {
        self->fail("Read failed: " + ec.message());
      } else if (is_eof) {
        if (self->chunked_ && !self->dechunker_.done()) {
          self->fail("Connection closed inside a chunked body");
        } else {
          self->complete();
        }
      } else {
        self->read_body();
      }
    });
  }

  void process_body(const std::string& raw) {
    received_ += raw.size();
    if (!chunked_) {
      deliver(raw);
    } else {
      std::string decoded;
      if (!dechunker_.feed(raw, decoded)) {
        fail("Malformed chunked encoding");
        return;
      }
      if (!decoded.empty()) deliver(decoded);
      if (dechunker_.done()) {
        complete();
        return;
      }
    }
    if (content_length_ && received_ >= *content_length_) {
      complete();
    }
  }

  void deliver(const std::string& data) {
    if (result_.status_code >= 200 && result_.status_code < 300) {
      if (on_data_) on_data_(data);
    } else if (result_.body.size() < kMaxErrorBody) {
      result_.body += data.substr(0, kMaxErrorBody - result_.body.size());
    }
  }

  void fail(const std::string& error) {
    if (finished_) return;
    spdlog::warn("Stream to {}{} failed: {}", url_.host, url_.path, error);
    result_.error = error;
    complete();
  }

  void complete() {
    if (finished_) return;
    finished_ = true;
    timer_.cancel();
    close_socket();
    if (on_complete_) on_complete_(result_);
    on_data_ = nullptr;
    on_complete_ = nullptr;
  }

  void close_socket() {
    asio::error_code ec;
    resolver_.cancel();
    socket_->lowest_layer().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_->lowest_layer().close(ec);
  }

  asio::io_context& io_ctx_;
  std::shared_ptr<Socket> socket_;
  asio::ip::tcp::resolver resolver_;
  asio::steady_timer timer_;
  asio::streambuf buffer_;

  ParsedUrl url_;
  HttpOptions options_;
  std::string request_;
  StreamDataCallback on_data_;
  StreamCompleteCallback on_complete_;

  StreamResult result_;
  bool chunked_ = false;
  ChunkedDecoder dechunker_;
  std::optional<uint64_t> content_length_;
  uint64_t received_ = 0;
  bool finished_ = false;
};

// Reported for a URL that never reaches the network
class FailedCall : public StreamCall {
 public:
  void cancel() override {}
};

}  // namespace

class HttpClient::Impl {
 public:
  explicit Impl(asio::io_context& io_ctx) : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
  }

  std::shared_ptr<StreamCall> open_stream(const std::string& url, const HttpOptions& options, StreamDataCallback on_data,
                                          StreamCompleteCallback on_complete) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      StreamResult result;
      result.error = "Invalid URL: " + url;
      asio::post(io_ctx_, [on_complete = std::move(on_complete), result]() { on_complete(result); });
      return std::make_shared<FailedCall>();
    }

    if (parsed->is_https()) {
      auto socket = std::make_shared<SslSocket>(io_ctx_, ssl_ctx_);
      auto session =
          std::make_shared<StreamSession<SslSocket>>(io_ctx_, std::move(socket), *parsed, options, std::move(on_data), std::move(on_complete));
      asio::post(io_ctx_, [session]() { session->start(); });
      return session;
    }

    auto socket = std::make_shared<TcpSocket>(io_ctx_);
    auto session = std::make_shared<StreamSession<TcpSocket>>(io_ctx_, std::move(socket), *parsed, options, std::move(on_data), std::move(on_complete));
    asio::post(io_ctx_, [session]() { session->start(); });
    return session;
  }

 private:
  asio::io_context& io_ctx_;
  asio::ssl::context ssl_ctx_;
};

HttpClient::HttpClient(asio::io_context& io_ctx) : impl_(std::make_unique<Impl>(io_ctx)) {}

HttpClient::~HttpClient() = default;

std::shared_ptr<StreamCall> HttpClient::open_stream(const std::string& url, const HttpOptions& options, StreamDataCallback on_data,
                                                    StreamCompleteCallback on_complete) {
  return impl_->open_stream(url, options, std::move(on_data), std::move(on_complete));
}

}  // namespace agentwire::net
