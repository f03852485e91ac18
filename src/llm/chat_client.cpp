#include <labscan/llm/chat_client.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace labscan::llm {

namespace lc = labscan::core;
using json = nlohmann::json;

json build_chat_payload(const ChatRequest& request) {
  json user_content;
  if (request.image) {
    const std::string url =
        "data:" + request.image->mime_type + ";base64," + request.image->base64_data;
    user_content = json::array({
        {{"type", "text"}, {"text", request.user_text}},
        {{"type", "image_url"}, {"image_url", {{"url", url}}}},
    });
  } else {
    user_content = request.user_text;
  }

  return json{
      {"model", request.model},
      {"messages",
       json::array({
           {{"role", "system"}, {"content", request.system_prompt}},
           {{"role", "user"}, {"content", std::move(user_content)}},
       })},
      {"temperature", request.temperature},
  };
}

std::expected<ChatCompletion, lc::PipelineError> parse_chat_response(std::string_view body) {
  const json doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object()) {
    spdlog::warn("chat response is not a JSON object");
    return std::unexpected(lc::PipelineError::MalformedResponse);
  }

  const auto choices = doc.find("choices");
  if (choices == doc.end() || !choices->is_array() || choices->empty()) {
    spdlog::warn("chat response has no choices");
    return std::unexpected(lc::PipelineError::MalformedResponse);
  }
  const json& first = choices->front();
  if (!first.is_object() || !first.contains("message") || !first["message"].is_object()) {
    return std::unexpected(lc::PipelineError::MalformedResponse);
  }
  const json& message = first["message"];
  const auto content = message.find("content");
  if (content == message.end() || !content->is_string()) {
    return std::unexpected(lc::PipelineError::MalformedResponse);
  }

  ChatCompletion completion;
  completion.content = content->get<std::string>();
  if (const auto model = doc.find("model"); model != doc.end() && model->is_string()) {
    completion.model = model->get<std::string>();
  }
  return completion;
}

}  // namespace labscan::llm
