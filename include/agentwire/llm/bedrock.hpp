#pragma once

#include <map>
#include <optional>
#include <string>

#include "agentwire/llm/decoder.hpp"
#include "agentwire/llm/request.hpp"
#include "agentwire/net/event_stream_decoder.hpp"
#include "agentwire/net/transport.hpp"

namespace agentwire::llm {

// Bedrock ConverseStream: POST {base}/model/{id}/converse-stream, AWS event-stream frames
class BedrockConverseAdapter {
 public:
  static constexpr const char* kApi = api::kBedrockConverseStream;
  static constexpr const char* kDefaultBaseUrl = "https://bedrock-runtime.us-east-1.amazonaws.com";

  std::string url(const Request& request, const Endpoint& endpoint) const;
  net::HttpOptions http_options(const Request& request, const Endpoint& endpoint) const;

  static json build_body(const Request& request);

  class Decoder : public StreamDecoder {
   public:
    explicit Decoder(EventCallback emit) : StreamDecoder(std::move(emit)) {}

    void feed(std::string_view chunk);
    void finish();

   private:
    void handle(const net::EventStreamMessage& message);
    void handle_event(const std::string& event_type, const json& payload);

    net::EventStreamDecoder frames_;
    std::map<int, std::string> tool_blocks_;  // contentBlockIndex -> toolUseId
    std::optional<FinishReason> stop_reason_;
  };
};

}  // namespace agentwire::llm
