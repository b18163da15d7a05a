#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace agentwire::net {

struct SseEvent {
  std::string event;  // "message" when the stream did not name it
  std::string data;   // data lines joined with '\n'
  std::string id;
};

/**
 * Incremental text/event-stream parser.
 *
 * Chunks may split lines anywhere, including between '\r' and '\n'.
 * Comment lines (leading ':') and unknown fields are ignored; an event is
 * dispatched on a blank line once it carries at least one data line.
 */
class SseParser {
 public:
  std::vector<SseEvent> feed(std::string_view chunk);

  // Dispatch a trailing event the server did not terminate with a blank line
  std::vector<SseEvent> finish();

 private:
  void process_line(std::string_view line, std::vector<SseEvent>& out);
  void dispatch(std::vector<SseEvent>& out);

  std::string buffer_;
  bool skip_lf_ = false;
  SseEvent current_;
  bool has_data_ = false;
};

}  // namespace agentwire::net
