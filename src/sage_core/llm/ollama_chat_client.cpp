#include "sage_core/llm/ollama_chat_client.hpp"

#include <curl/curl.h>

#include <iostream>
#include <memory>
#include <mutex>

#include "sage_core/errors.hpp"
#include "sage_core/llm/ndjson_stream_decoder.hpp"

namespace sage_core {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

CurlHandle make_handle() {
  static std::once_flag global_init;
  std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

  CurlHandle handle(curl_easy_init(), &curl_easy_cleanup);
  if (!handle) {
    throw GenerationError("Failed to initialize CURL");
  }
  return handle;
}

struct StreamState {
  StreamState(CURL *handle, const FragmentCallback &on_fragment)
      : curl(handle), sink(on_fragment) {}

  CURL *curl;
  ChatStreamSink sink;
};

size_t stream_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  auto *state = static_cast<StreamState *>(userp);
  long status = 0;
  curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &status);
  return state->sink.consume(std::string_view(static_cast<char *>(contents), size * nmemb),
                             status);
}

}  // namespace

size_t ChatStreamSink::consume(std::string_view bytes, long http_status) noexcept {
  if (failure_ || stopped_) {
    return 0;
  }
  try {
    if (http_status >= 400) {
      error_body_.append(bytes.data(), bytes.size());
      return bytes.size();
    }
    for (const auto &fragment : decoder_.feed(bytes)) {
      if (!on_fragment_(fragment)) {
        stopped_ = true;
        return 0;
      }
    }
    if (decoder_.done()) {
      stopped_ = true;
      return 0;
    }
    return bytes.size();
  } catch (const std::exception &) {
    failure_ = std::current_exception();
    return 0;
  }
}

void ChatStreamSink::finish() {
  if (stopped_ || failure_) {
    return;
  }
  for (const auto &fragment : decoder_.finish()) {
    if (!on_fragment_(fragment)) {
      stopped_ = true;
      return;
    }
  }
}

void ChatStreamSink::rethrow_if_failed() const {
  if (failure_) {
    std::rethrow_exception(failure_);
  }
}

OllamaChatClient::OllamaChatClient(const std::string &endpoint,
                                   const std::string &model,
                                   bool enable_thinking,
                                   long request_timeout_seconds)
    : endpoint_(endpoint),
      model_(model),
      enable_thinking_(enable_thinking),
      request_timeout_seconds_(request_timeout_seconds) {}

std::string OllamaChatClient::build_url(const std::string &path) const {
  std::string url = endpoint_;
  if (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url + path;
}

size_t OllamaChatClient::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

nlohmann::json OllamaChatClient::build_request(const std::vector<ChatMessage> &messages,
                                               const GenerationOptions &options,
                                               bool stream) const {
  nlohmann::json body;
  body["model"] = model_;
  body["stream"] = stream;
  body["think"] = enable_thinking_;
  body["messages"] = nlohmann::json::array();
  for (const auto &message : messages) {
    body["messages"].push_back({{"role", message.role}, {"content", message.content}});
  }
  body["options"] = {{"temperature", options.temperature}};
  if (options.max_tokens) {
    body["options"]["num_predict"] = *options.max_tokens;
  }
  return body;
}

bool OllamaChatClient::health_check() {
  try {
    CurlHandle curl = make_handle();
    std::string response;
    const std::string url = build_url("/api/tags");
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 5L);

    if (curl_easy_perform(curl.get()) != CURLE_OK) {
      return false;
    }
    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    return status >= 200 && status < 300;
  } catch (const GenerationError &e) {
    std::cerr << "Ollama health check failed: " << e.what() << std::endl;
    return false;
  }
}

std::string OllamaChatClient::generate(const std::vector<ChatMessage> &messages,
                                       const GenerationOptions &options) {
  CurlHandle curl = make_handle();
  HeaderList headers(curl_slist_append(nullptr, "Content-Type: application/json"),
                     &curl_slist_free_all);

  const std::string url = build_url("/api/chat");
  const std::string payload = build_request(messages, options, /*stream*/ false).dump();
  std::string response;

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 10L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, request_timeout_seconds_);

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw GenerationError("Failed to chat with Ollama: " + std::string(curl_easy_strerror(res)));
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    throw GenerationError("Ollama API error: " + std::to_string(status) + " " + response);
  }

  return parse_chat_response(response);
}

std::string OllamaChatClient::parse_chat_response(const std::string &response) {
  nlohmann::json body = nlohmann::json::parse(response, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    throw GenerationError("Ollama chat response is not a JSON object");
  }
  auto message = body.find("message");
  if (message == body.end() || !message->is_object()) {
    throw GenerationError("Ollama chat response is missing message content");
  }
  auto content = message->find("content");
  if (content == message->end() || !content->is_string()) {
    throw GenerationError("Ollama chat response is missing message content");
  }
  return content->get<std::string>();
}

void OllamaChatClient::generate_stream(const std::vector<ChatMessage> &messages,
                                       const GenerationOptions &options,
                                       const FragmentCallback &on_fragment) {
  CurlHandle curl = make_handle();
  HeaderList headers(curl_slist_append(nullptr, "Content-Type: application/json"),
                     &curl_slist_free_all);

  const std::string url = build_url("/api/chat");
  const std::string payload = build_request(messages, options, /*stream*/ true).dump();

  StreamState state(curl.get(), on_fragment);

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, stream_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 10L);

  CURLcode res = curl_easy_perform(curl.get());
  state.sink.rethrow_if_failed();
  if (res == CURLE_WRITE_ERROR && state.sink.stopped()) {
    res = CURLE_OK;
  }
  if (res != CURLE_OK) {
    throw GenerationError("Failed to stream chat with Ollama: " +
                          std::string(curl_easy_strerror(res)));
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status >= 400) {
    throw GenerationError("Ollama API error: " + std::to_string(status) + " " +
                          state.sink.error_body());
  }

  state.sink.finish();
  if (!state.sink.stream_error().empty()) {
    throw GenerationError("Ollama stream error: " + state.sink.stream_error());
  }
}

}  // namespace sage_core
