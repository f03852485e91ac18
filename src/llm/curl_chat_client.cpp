#include <labscan/llm/curl_chat_client.hpp>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace labscan::llm {

namespace lc = labscan::core;

namespace {

std::once_flag g_curl_init;

struct CurlEasyDeleter {
  void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};
struct CurlSlistDeleter {
  void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

std::size_t write_body(char* data, std::size_t size, std::size_t nmemb, void* userp) {
  auto* body = static_cast<std::string*>(userp);
  body->append(data, size * nmemb);
  return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int check_stop(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* stop = static_cast<const std::stop_token*>(clientp);
  return stop->stop_requested() ? 1 : 0;
}

std::string strip_trailing_slashes(std::string url) {
  while (!url.empty() && url.back() == '/') url.pop_back();
  return url;
}

}  // namespace

CurlChatClient::CurlChatClient(ChatEndpoint endpoint)
    : endpoint_(std::move(endpoint)),
      url_(strip_trailing_slashes(endpoint_.base_url) + "/chat/completions") {
  if (endpoint_.base_url.empty()) {
    throw std::runtime_error("CurlChatClient: base_url is empty");
  }
  std::call_once(g_curl_init, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      spdlog::error("curl_global_init failed");
    }
  });
}

std::expected<ChatCompletion, lc::PipelineError> CurlChatClient::complete(
    const ChatRequest& request) {
  if (request.stop.stop_requested()) {
    return std::unexpected(lc::PipelineError::Cancelled);
  }

  std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
  if (!curl) {
    spdlog::error("curl_easy_init failed");
    return std::unexpected(lc::PipelineError::TransportError);
  }

  // curl_slist_append returns null on failure and leaves the list untouched.
  std::unique_ptr<curl_slist, CurlSlistDeleter> headers(
      curl_slist_append(nullptr, "Content-Type: application/json"));
  bool headers_ok = headers != nullptr;
  if (headers_ok && !endpoint_.api_key.empty()) {
    const std::string auth = "Authorization: Bearer " + endpoint_.api_key;
    headers_ok = curl_slist_append(headers.get(), auth.c_str()) != nullptr;
  }
  if (!headers_ok) {
    spdlog::error("curl_slist_append failed");
    return std::unexpected(lc::PipelineError::TransportError);
  }

  const std::string payload = build_chat_payload(request).dump();
  std::string response;
  std::stop_token stop = request.stop;

  CURL* h = curl.get();
  curl_easy_setopt(h, CURLOPT_URL, url_.c_str());
  curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, check_stop);
  curl_easy_setopt(h, CURLOPT_XFERINFODATA, &stop);

  const CURLcode rc = curl_easy_perform(h);
  if (rc == CURLE_ABORTED_BY_CALLBACK) {
    spdlog::info("chat request to {} cancelled", request.model);
    return std::unexpected(lc::PipelineError::Cancelled);
  }
  if (rc == CURLE_OPERATION_TIMEDOUT) {
    spdlog::error("chat request to {} timed out after {} ms", request.model,
                  request.timeout.count());
    return std::unexpected(lc::PipelineError::Timeout);
  }
  if (rc != CURLE_OK) {
    spdlog::error("chat request to {} failed: {}", url_, curl_easy_strerror(rc));
    return std::unexpected(lc::PipelineError::TransportError);
  }

  long status = 0;
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    spdlog::error("chat request to {} returned HTTP {}", url_, status);
    return std::unexpected(lc::PipelineError::HttpStatus);
  }

  auto completion = parse_chat_response(response);
  if (completion) {
    spdlog::debug("chat reply ({} chars): {:.200}", completion->content.size(),
                  completion->content);
  }
  return completion;
}

}  // namespace labscan::llm
