#pragma once

#include <labscan/core/error.hpp>
#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace labscan::llm {

/// Inline image sent with the user turn (base64 payload, no data: prefix).
struct ImageAttachment {
  std::string mime_type{"image/png"};
  std::string base64_data;
};

/// One chat-completion request: system prompt + single user turn.
struct ChatRequest {
  std::string model;
  std::string system_prompt;
  std::string user_text;
  std::optional<ImageAttachment> image;
  double temperature{0.1};
  std::chrono::milliseconds timeout{std::chrono::seconds(90)};
  std::stop_token stop;
};

struct ChatCompletion {
  std::string content;
  std::string model;
};

/// OpenAI-compatible chat completion endpoint.
/// Implementations must be safe to call from several page workers at once.
class IChatClient {
 public:
  virtual ~IChatClient() = default;

  [[nodiscard]] virtual std::expected<ChatCompletion, labscan::core::PipelineError>
  complete(const ChatRequest& request) = 0;
};

/// Request body for POST /chat/completions. With an image, the user content
/// becomes [{type:text}, {type:image_url, image_url:{url:"data:<mime>;base64,..."}}].
[[nodiscard]] nlohmann::json build_chat_payload(const ChatRequest& request);

/// choices[0].message.content of a completion response body.
/// MalformedResponse if the body is not JSON or the field is missing.
[[nodiscard]] std::expected<ChatCompletion, labscan::core::PipelineError>
parse_chat_response(std::string_view body);

}  // namespace labscan::llm
