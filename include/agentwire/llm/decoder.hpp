#pragma once

#include <string_view>

#include "agentwire/llm/event.hpp"

namespace agentwire::llm {

/**
 * Shared state of the per-protocol stream decoders.
 *
 * A decoder is a pure state machine: feed() takes raw body bytes split at
 * arbitrary boundaries, finish() marks the end of the body. Exactly one
 * terminal event (Finish or StreamError) is emitted; anything after it is
 * dropped.
 */
class StreamDecoder {
 public:
  bool done() const {
    return done_;
  }

 protected:
  explicit StreamDecoder(EventCallback emit) : emit_(std::move(emit)) {}

  void emit(CanonicalEvent event) {
    if (done_) return;
    if (is_terminal(event)) done_ = true;
    emit_(std::move(event));
  }

  void fail(Error error) {
    emit(StreamError{std::move(error)});
  }

  // Run one payload handler; a JSON exception ends the stream with MalformedStream
  template <typename Handler>
  void guarded(const char* protocol, Handler&& handler) {
    try {
      handler();
    } catch (const nlohmann::json::exception& e) {
      payload_failed(protocol, e);
    }
  }

  // Body ended without a terminal event
  void end_of_stream() {
    if (!done_) {
      fail(Error::network("stream ended before a terminal event"));
    }
  }

 private:
  void payload_failed(const char* protocol, const nlohmann::json::exception& e);

  EventCallback emit_;
  bool done_ = false;
};

}  // namespace agentwire::llm
