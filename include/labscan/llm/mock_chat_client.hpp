#pragma once

#include <labscan/llm/chat_client.hpp>
#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace labscan::llm {

/// Scripted chat client for tests and the CLI's mock backend.
/// Queued replies are served first (FIFO); once empty, the default reply is used.
/// Thread-safe.
class MockChatClient : public IChatClient {
 public:
  using Reply = std::variant<std::string, labscan::core::PipelineError>;

  MockChatClient() = default;

  /// Reply used when the queue is empty. Defaults to an empty marker list.
  void set_default_reply(Reply reply);
  /// Reply used for requests that carry an image, when the queue is empty.
  void set_vision_reply(Reply reply);
  void enqueue(Reply reply);

  [[nodiscard]] std::expected<ChatCompletion, labscan::core::PipelineError>
  complete(const ChatRequest& request) override;

  [[nodiscard]] std::size_t call_count() const noexcept { return call_count_.load(); }
  /// Copies of the requests received so far, in arrival order.
  [[nodiscard]] std::vector<ChatRequest> requests() const;

 private:
  mutable std::mutex mutex_;
  std::deque<Reply> queue_;
  Reply default_reply_{std::string(R"({"markers": [], "confidence": 0.0})")};
  std::optional<Reply> vision_reply_;
  std::vector<ChatRequest> requests_;
  std::atomic<std::size_t> call_count_{0};
};

}  // namespace labscan::llm
