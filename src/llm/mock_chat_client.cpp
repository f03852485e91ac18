#include <labscan/llm/mock_chat_client.hpp>
#include <utility>

namespace labscan::llm {

namespace lc = labscan::core;

void MockChatClient::set_default_reply(Reply reply) {
  std::lock_guard lock(mutex_);
  default_reply_ = std::move(reply);
}

void MockChatClient::set_vision_reply(Reply reply) {
  std::lock_guard lock(mutex_);
  vision_reply_ = std::move(reply);
}

void MockChatClient::enqueue(Reply reply) {
  std::lock_guard lock(mutex_);
  queue_.push_back(std::move(reply));
}

std::expected<ChatCompletion, lc::PipelineError> MockChatClient::complete(
    const ChatRequest& request) {
  ++call_count_;
  Reply reply;
  {
    std::lock_guard lock(mutex_);
    requests_.push_back(request);
    if (!queue_.empty()) {
      reply = std::move(queue_.front());
      queue_.pop_front();
    } else if (request.image && vision_reply_) {
      reply = *vision_reply_;
    } else {
      reply = default_reply_;
    }
  }

  if (request.stop.stop_requested()) {
    return std::unexpected(lc::PipelineError::Cancelled);
  }
  if (const auto* error = std::get_if<lc::PipelineError>(&reply)) {
    return std::unexpected(*error);
  }
  return ChatCompletion{std::get<std::string>(reply), request.model};
}

std::vector<ChatRequest> MockChatClient::requests() const {
  std::lock_guard lock(mutex_);
  return requests_;
}

}  // namespace labscan::llm
