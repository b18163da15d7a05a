#pragma once

#include <map>
#include <string>

#include "agentwire/llm/decoder.hpp"
#include "agentwire/llm/request.hpp"
#include "agentwire/net/sse_parser.hpp"
#include "agentwire/net/transport.hpp"

namespace agentwire::llm {

// OpenAI Responses API: POST {base}/responses, typed "response.*" SSE events
class OpenAIResponsesAdapter {
 public:
  static constexpr const char* kApi = api::kOpenAIResponses;
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
    struct Item {
      std::string id;  // call_id
      std::string name;
      std::string pending_args;
      bool opened = false;
      bool closed = false;
      bool streamed_args = false;
    };

    void handle(const json& j);
    Item* item_for(const json& j);
    void open_item(Item& item);
    void close_item(Item& item, const json& done_item);
    void complete(const json& response, FinishReason fallback);

    net::SseParser sse_;
    std::map<int, Item> items_;                   // by output_index
    std::map<std::string, int> index_by_item_id_;  // output item id -> output_index
    bool saw_tool_call_ = false;
  };
};

}  // namespace agentwire::llm
