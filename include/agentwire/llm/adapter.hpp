#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "agentwire/llm/anthropic.hpp"
#include "agentwire/llm/bedrock.hpp"
#include "agentwire/llm/event.hpp"
#include "agentwire/llm/openai_completions.hpp"
#include "agentwire/llm/openai_responses.hpp"
#include "agentwire/llm/request.hpp"
#include "agentwire/net/transport.hpp"

namespace agentwire::llm {

using Adapter = std::variant<OpenAICompletionsAdapter, OpenAIResponsesAdapter, AnthropicMessagesAdapter, BedrockConverseAdapter>;

// nullopt for an api id no adapter speaks
std::optional<Adapter> adapter_for_api(const std::string& api);

std::string api_of(const Adapter& adapter);

/**
 * Start one attempt. Decoded events are pushed into `out` as they arrive and
 * `out` is closed after the terminal event. A cancelled call closes `out`
 * without a terminal event.
 */
std::shared_ptr<net::StreamCall> send(const Adapter& adapter, net::StreamTransport& transport, const Request& request, const Endpoint& endpoint,
                                      std::shared_ptr<EventStream> out);

}  // namespace agentwire::llm
