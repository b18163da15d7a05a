#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "agentwire/llm/decoder.hpp"
#include "agentwire/llm/request.hpp"
#include "agentwire/net/sse_parser.hpp"
#include "agentwire/net/transport.hpp"

namespace agentwire::llm {

// OpenAI chat completions: POST {base}/chat/completions, token-delta SSE
class OpenAICompletionsAdapter {
 public:
  static constexpr const char* kApi = api::kOpenAICompletions;
  static constexpr const char* kDefaultBaseUrl = "https://api.openai.com/v1";

  std::string url(const Request& request, const Endpoint& endpoint) const;
  net::HttpOptions http_options(const Request& request, const Endpoint& endpoint) const;

  static json build_body(const Request& request);

  class Decoder : public StreamDecoder {
   public:
    explicit Decoder(EventCallback emit) : StreamDecoder(std::move(emit)) {}

    void feed(std::string_view chunk);
    void finish();

   private:
    // A call is announced once both its id and name are known;
    // argument fragments seen earlier wait in `pending_args`.
    struct Slot {
      std::string id;
      std::string name;
      std::string pending_args;
      bool opened = false;
      bool closed = false;
    };

    void handle_data(const std::string& data);
    void handle_tool_delta(const json& tc);
    void close_calls();
    void complete();

    net::SseParser sse_;
    std::map<int, Slot> slots_;
    std::optional<FinishReason> finish_reason_;
  };
};

}  // namespace agentwire::llm
