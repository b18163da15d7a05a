#pragma once

#include <map>
#include <optional>
#include <string>

#include "agentwire/llm/decoder.hpp"
#include "agentwire/llm/request.hpp"
#include "agentwire/net/sse_parser.hpp"
#include "agentwire/net/transport.hpp"

namespace agentwire::llm {

// Anthropic Messages API: POST {base}/messages, content-block SSE
class AnthropicMessagesAdapter {
 public:
  static constexpr const char* kApi = api::kAnthropicMessages;
  static constexpr const char* kDefaultBaseUrl = "https://api.anthropic.com/v1";
  static constexpr const char* kApiVersion = "2023-06-01";
  static constexpr int kDefaultMaxTokens = 8192;

  std::string url(const Request& request, const Endpoint& endpoint) const;
  net::HttpOptions http_options(const Request& request, const Endpoint& endpoint) const;

  static json build_body(const Request& request);

  class Decoder : public StreamDecoder {
   public:
    explicit Decoder(EventCallback emit) : StreamDecoder(std::move(emit)) {}

    void feed(std::string_view chunk);
    void finish();

   private:
    void handle(const json& j);

    net::SseParser sse_;
    std::map<int, std::string> tool_blocks_;  // content block index -> tool_use id
    std::optional<FinishReason> stop_reason_;
  };
};

}  // namespace agentwire::llm
