#include "agentwire/net/event_stream_decoder.hpp"

#include <array>

namespace agentwire::net {

namespace {

constexpr size_t kPreludeSize = 12;
constexpr size_t kMinFrameSize = 16;
constexpr uint32_t kMaxFrameSize = 16 * 1024 * 1024;

std::array<uint32_t, 256> make_crc_table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
    }
    table[i] = c;
  }
  return table;
}

uint32_t read_u32(std::string_view data, size_t offset) {
  return (static_cast<uint32_t>(static_cast<unsigned char>(data[offset])) << 24) |
         (static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 1])) << 16) |
         (static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 2])) << 8) |
         static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 3]));
}

uint16_t read_u16(std::string_view data, size_t offset) {
  return static_cast<uint16_t>((static_cast<unsigned char>(data[offset]) << 8) | static_cast<unsigned char>(data[offset + 1]));
}

}  // namespace

uint32_t crc32(std::string_view data, uint32_t crc) {
  static const auto table = make_crc_table();
  crc = ~crc;
  for (unsigned char c : data) {
    crc = table[(crc ^ c) & 0xFF] ^ (crc >> 8);
  }
  return ~crc;
}

std::vector<EventStreamMessage> EventStreamDecoder::feed(std::string_view chunk) {
  std::vector<EventStreamMessage> out;
  buffer_.append(chunk);

  size_t offset = 0;
  while (buffer_.size() - offset >= kPreludeSize) {
    std::string_view view(buffer_);
    uint32_t total = read_u32(view, offset);
    uint32_t headers_len = read_u32(view, offset + 4);
    uint32_t prelude_crc = read_u32(view, offset + 8);

    if (crc32(view.substr(offset, 8)) != prelude_crc) {
      throw EventStreamError("event-stream prelude checksum mismatch");
    }
    if (total < kMinFrameSize || total > kMaxFrameSize || headers_len > total - kMinFrameSize) {
      throw EventStreamError("event-stream frame length out of range: " + std::to_string(total));
    }
    if (buffer_.size() - offset < total) {
      break;
    }

    out.push_back(decode_frame(view.substr(offset, total)));
    offset += total;
  }

  buffer_.erase(0, offset);
  return out;
}

EventStreamMessage EventStreamDecoder::decode_frame(std::string_view frame) const {
  uint32_t total = static_cast<uint32_t>(frame.size());
  uint32_t headers_len = read_u32(frame, 4);
  uint32_t message_crc = read_u32(frame, total - 4);
  if (crc32(frame.substr(0, total - 4)) != message_crc) {
    throw EventStreamError("event-stream message checksum mismatch");
  }

  EventStreamMessage message;
  std::string_view headers = frame.substr(kPreludeSize, headers_len);
  size_t pos = 0;
  auto need = [&](size_t n) {
    if (pos + n > headers.size()) throw EventStreamError("event-stream header truncated");
  };

  while (pos < headers.size()) {
    need(1);
    size_t name_len = static_cast<unsigned char>(headers[pos++]);
    need(name_len + 1);
    std::string name(headers.substr(pos, name_len));
    pos += name_len;
    auto type = static_cast<unsigned char>(headers[pos++]);

    switch (type) {
      case 0:  // bool true
      case 1:  // bool false
        break;
      case 2:  // byte
        need(1);
        pos += 1;
        break;
      case 3:  // short
        need(2);
        pos += 2;
        break;
      case 4:  // int
        need(4);
        pos += 4;
        break;
      case 5:  // long
      case 8:  // timestamp
        need(8);
        pos += 8;
        break;
      case 6:    // byte array
      case 7: {  // string
        need(2);
        uint16_t len = read_u16(headers, pos);
        pos += 2;
        need(len);
        if (type == 7) message.headers[name] = std::string(headers.substr(pos, len));
        pos += len;
        break;
      }
      case 9:  // uuid
        need(16);
        pos += 16;
        break;
      default:
        throw EventStreamError("event-stream header '" + name + "' has unknown type " + std::to_string(type));
    }
  }

  message.payload = std::string(frame.substr(kPreludeSize + headers_len, total - kPreludeSize - headers_len - 4));
  return message;
}

}  // namespace agentwire::net
