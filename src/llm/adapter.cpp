#include "agentwire/llm/adapter.hpp"

#include <spdlog/spdlog.h>

namespace agentwire::llm {

namespace {

template <typename A>
std::shared_ptr<net::StreamCall> send_with(const A& adapter, net::StreamTransport& transport, const Request& request, const Endpoint& endpoint,
                                           std::shared_ptr<EventStream> out) {
  // The decoder lives on the transport thread only
  auto decoder = std::make_shared<typename A::Decoder>([out](CanonicalEvent event) { out->push(std::move(event)); });

  auto url = adapter.url(request, endpoint);
  auto options = adapter.http_options(request, endpoint);
  spdlog::debug("{} request to {} (model={}, {} messages, {} tools)", A::kApi, url, request.model, request.messages.size(), request.tools.size());

  return transport.open_stream(
      url, options, [decoder](const std::string& chunk) { decoder->feed(chunk); },
      [decoder, out](const net::StreamResult& result) {
        if (result.cancelled) {
          out->close();
          return;
        }
        if (result.status_code >= 200 && result.status_code < 300) {
          if (result.error.empty()) {
            decoder->finish();
          } else if (!decoder->done()) {
            out->push(StreamError{Error::network(result.error)});
          }
        } else if (result.status_code == 0) {
          out->push(StreamError{Error::network(result.error.empty() ? "no response" : result.error)});
        } else {
          out->push(StreamError{error_from_http(result.status_code, result.body, result.headers)});
        }
        out->close();
      });
}

}  // namespace

std::optional<Adapter> adapter_for_api(const std::string& api) {
  if (api == OpenAICompletionsAdapter::kApi) return Adapter{OpenAICompletionsAdapter{}};
  if (api == OpenAIResponsesAdapter::kApi) return Adapter{OpenAIResponsesAdapter{}};
  if (api == AnthropicMessagesAdapter::kApi) return Adapter{AnthropicMessagesAdapter{}};
  if (api == BedrockConverseAdapter::kApi) return Adapter{BedrockConverseAdapter{}};
  return std::nullopt;
}

std::string api_of(const Adapter& adapter) {
  return std::visit([](const auto& a) -> std::string { return std::decay_t<decltype(a)>::kApi; }, adapter);
}

std::shared_ptr<net::StreamCall> send(const Adapter& adapter, net::StreamTransport& transport, const Request& request, const Endpoint& endpoint,
                                      std::shared_ptr<EventStream> out) {
  return std::visit([&](const auto& a) { return send_with(a, transport, request, endpoint, out); }, adapter);
}

}  // namespace agentwire::llm
