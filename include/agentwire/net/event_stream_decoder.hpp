#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace agentwire::net {

// One frame of the AWS binary event-stream encoding
struct EventStreamMessage {
  std::map<std::string, std::string> headers;  // string-typed headers only
  std::string payload;

  std::string header(const std::string& name) const {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : std::string();
  }
};

class EventStreamError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// CRC-32 (IEEE 802.3), as used by the prelude and message checksums
uint32_t crc32(std::string_view data, uint32_t crc = 0);

/**
 * Incremental decoder for the framing
 *
 *   total_length:u32 headers_length:u32 prelude_crc:u32
 *   headers payload message_crc:u32
 *
 * all integers big-endian. Throws EventStreamError on a checksum or length
 * violation; the decoder is unusable afterwards.
 */
class EventStreamDecoder {
 public:
  std::vector<EventStreamMessage> feed(std::string_view chunk);

  // Bytes of an incomplete frame are still buffered
  bool has_partial() const {
    return !buffer_.empty();
  }

 private:
  EventStreamMessage decode_frame(std::string_view frame) const;

  std::string buffer_;
};

}  // namespace agentwire::net
