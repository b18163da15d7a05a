#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace agentwire::net {

struct HttpOptions {
  std::string method = "POST";
  std::map<std::string, std::string> headers;
  std::string body;
  // Covers resolve, connect, TLS handshake, request write and response headers
  std::chrono::milliseconds connect_timeout{15000};
  // Maximum silence between two body reads
  std::chrono::milliseconds read_timeout{60000};
};

// Final state of a streaming request
struct StreamResult {
  int status_code = 0;                         // 0 when no response line was received
  std::map<std::string, std::string> headers;  // lowercase names
  std::string body;                            // collected body of a non-2xx response
  std::string error;                           // transport failure, empty on clean end of stream
  bool timed_out = false;
  bool cancelled = false;

  bool ok() const {
    return status_code >= 200 && status_code < 300 && error.empty() && !cancelled;
  }
};

using StreamDataCallback = std::function<void(const std::string& chunk)>;
using StreamCompleteCallback = std::function<void(const StreamResult& result)>;

// Handle of one in-flight request
class StreamCall {
 public:
  virtual ~StreamCall() = default;

  // Safe from any thread; on_complete then reports cancelled unless it already ran
  virtual void cancel() = 0;
};

/**
 * Opens streaming HTTP requests.
 *
 * on_data receives decoded body bytes of a 2xx response in arrival order.
 * on_complete is invoked exactly once, after the last on_data.
 */
class StreamTransport {
 public:
  virtual ~StreamTransport() = default;

  virtual std::shared_ptr<StreamCall> open_stream(const std::string& url, const HttpOptions& options, StreamDataCallback on_data,
                                                  StreamCompleteCallback on_complete) = 0;
};

}  // namespace agentwire::net
