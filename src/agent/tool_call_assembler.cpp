#include "agentwire/agent/tool_call_assembler.hpp"

namespace agentwire {

PendingCall* ToolCallAssembler::find(const std::string& id) {
  for (auto& c : calls_) {
    if (c.id == id) return &c;
  }
  return nullptr;
}

std::optional<Error> ToolCallAssembler::apply(const llm::CanonicalEvent& event) {
  if (auto* e = std::get_if<llm::ToolCallOpen>(&event)) {
    if (find(e->id)) {
      return Error::malformed("tool call '" + e->id + "' opened twice");
    }
    PendingCall pending;
    pending.id = e->id;
    pending.name = e->name;
    calls_.push_back(std::move(pending));
  } else if (auto* e = std::get_if<llm::ToolCallArgDelta>(&event)) {
    PendingCall* pending = find(e->id);
    if (!pending || pending->closed) {
      return Error::malformed("argument fragment for tool call '" + e->id + "' that is not open");
    }
    pending->args += e->fragment;
  } else if (auto* e = std::get_if<llm::ToolCallClose>(&event)) {
    PendingCall* pending = find(e->id);
    if (!pending || pending->closed) {
      return Error::malformed("close for tool call '" + e->id + "' that is not open");
    }
    pending->closed = true;
    if (!pending->args.empty()) {
      pending->arguments = json::parse(pending->args, nullptr, false);
      if (pending->arguments.is_discarded() || !pending->arguments.is_object()) {
        pending->args_valid = false;
        pending->parse_error = "arguments are not a JSON object: " + pending->args.substr(0, 200);
        pending->arguments = json::object();
      }
    }
  } else if (std::holds_alternative<llm::Finish>(event)) {
    for (const auto& c : calls_) {
      if (!c.closed) {
        return Error::malformed("stream finished with tool call '" + c.id + "' still open");
      }
    }
  }
  return std::nullopt;
}

}  // namespace agentwire
