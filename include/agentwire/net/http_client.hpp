#pragma once

#include <asio.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "agentwire/net/transport.hpp"

namespace agentwire::net {

// HTTP/1.1 streaming client on asio, TLS through OpenSSL
class HttpClient : public StreamTransport {
 public:
  explicit HttpClient(asio::io_context& io_ctx);

  ~HttpClient() override;

  std::shared_ptr<StreamCall> open_stream(const std::string& url, const HttpOptions& options, StreamDataCallback on_data,
                                          StreamCompleteCallback on_complete) override;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

// Decoder for "Transfer-Encoding: chunked" bodies
class ChunkedDecoder {
 public:
  // Appends decoded payload to `out`; false on a malformed framing
  bool feed(std::string_view in, std::string& out);

  bool done() const {
    return state_ == State::Done;
  }

 private:
  enum class State { Size, Data, DataEnd, Trailer, Done };

  State state_ = State::Size;
  size_t remaining_ = 0;
  std::string line_;
};

struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;

  bool is_https() const {
    return scheme == "https";
  }
  std::string port_or_default() const;

  static std::optional<ParsedUrl> parse(const std::string& url);
};

// "https://host/v1" + "chat/completions" -> "https://host/v1/chat/completions"
std::string join_url(const std::string& base, const std::string& path);

// Percent-encode a single path segment
std::string url_encode(const std::string& segment);

}  // namespace agentwire::net
