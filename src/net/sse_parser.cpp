#include "agentwire/net/sse_parser.hpp"

namespace agentwire::net {

std::vector<SseEvent> SseParser::feed(std::string_view chunk) {
  std::vector<SseEvent> out;

  for (char c : chunk) {
    if (skip_lf_) {
      skip_lf_ = false;
      if (c == '\n') continue;
    }
    if (c == '\r') {
      skip_lf_ = true;
      process_line(buffer_, out);
      buffer_.clear();
    } else if (c == '\n') {
      process_line(buffer_, out);
      buffer_.clear();
    } else {
      buffer_ += c;
    }
  }

  return out;
}

std::vector<SseEvent> SseParser::finish() {
  std::vector<SseEvent> out;
  if (!buffer_.empty()) {
    process_line(buffer_, out);
    buffer_.clear();
  }
  dispatch(out);
  return out;
}

void SseParser::process_line(std::string_view line, std::vector<SseEvent>& out) {
  if (line.empty()) {
    dispatch(out);
    return;
  }
  if (line.front() == ':') {
    return;
  }

  std::string_view field = line;
  std::string_view value;
  auto colon = line.find(':');
  if (colon != std::string_view::npos) {
    field = line.substr(0, colon);
    value = line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') value.remove_prefix(1);
  }

  if (field == "data") {
    if (has_data_) current_.data += '\n';
    current_.data.append(value);
    has_data_ = true;
  } else if (field == "event") {
    current_.event = std::string(value);
  } else if (field == "id") {
    current_.id = std::string(value);
  }
}

void SseParser::dispatch(std::vector<SseEvent>& out) {
  if (has_data_) {
    if (current_.event.empty()) current_.event = "message";
    out.push_back(std::move(current_));
  }
  current_ = SseEvent{};
  has_data_ = false;
}

}  // namespace agentwire::net
