#pragma once

#include <labscan/llm/chat_client.hpp>
#include <string>

namespace labscan::llm {

/// Where completions are sent. api_key is optional (local servers need none).
struct ChatEndpoint {
  std::string base_url{"http://localhost:11434/v1"};
  std::string api_key;
};

/// IChatClient over libcurl. One easy handle per call, so concurrent calls
/// from page workers do not share state. The transfer is aborted when the
/// request's stop_token fires (-> Cancelled) or its timeout elapses (-> Timeout).
class CurlChatClient : public IChatClient {
 public:
  explicit CurlChatClient(ChatEndpoint endpoint);

  [[nodiscard]] std::expected<ChatCompletion, labscan::core::PipelineError>
  complete(const ChatRequest& request) override;

  /// {base_url without trailing '/'}/chat/completions
  [[nodiscard]] const std::string& url() const noexcept { return url_; }

 private:
  ChatEndpoint endpoint_;
  std::string url_;
};

}  // namespace labscan::llm
