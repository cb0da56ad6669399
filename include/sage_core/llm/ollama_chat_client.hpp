#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "sage_core/llm/generation_backend.hpp"
#include "sage_core/llm/ndjson_stream_decoder.hpp"

namespace sage_core {

/**
 * @class ChatStreamSink
 * @brief Receives a streaming /api/chat body as curl delivers it.
 *
 * consume() runs inside libcurl's write callback, so nothing may propagate out of
 * it. An exception from decoding or from the fragment callback is held and the
 * transfer is stopped; rethrow_if_failed() raises it once curl has returned.
 */
class ChatStreamSink {
 public:
  explicit ChatStreamSink(const FragmentCallback &on_fragment) : on_fragment_(on_fragment) {}

  // Bytes accepted; fewer than bytes.size() aborts the transfer
  size_t consume(std::string_view bytes, long http_status) noexcept;

  // Delivers the unterminated tail once the transfer has ended normally
  void finish();

  void rethrow_if_failed() const;

  bool stopped() const {
    return stopped_;
  }

  const std::string &error_body() const {
    return error_body_;
  }

  // Error text Ollama reported inside the stream, if any
  const std::string &stream_error() const {
    return decoder_.error();
  }

 private:
  const FragmentCallback &on_fragment_;
  NdjsonStreamDecoder decoder_;
  std::string error_body_;
  std::exception_ptr failure_;
  bool stopped_ = false;
};

// Talks to Ollama's /api/chat endpoint over libcurl
class OllamaChatClient : public GenerationBackend {
 public:
  OllamaChatClient(const std::string &endpoint,
                   const std::string &model,
                   bool enable_thinking = false,
                   long request_timeout_seconds = 300);
  ~OllamaChatClient() override = default;

  OllamaChatClient(const OllamaChatClient &) = delete;
  OllamaChatClient &operator=(const OllamaChatClient &) = delete;

  bool health_check() override;

  std::string generate(const std::vector<ChatMessage> &messages,
                       const GenerationOptions &options) override;

  void generate_stream(const std::vector<ChatMessage> &messages,
                       const GenerationOptions &options,
                       const FragmentCallback &on_fragment) override;

  std::string model_name() const override {
    return model_;
  }

  nlohmann::json build_request(const std::vector<ChatMessage> &messages,
                               const GenerationOptions &options,
                               bool stream) const;

  // Content of a non-streaming /api/chat response body; throws GenerationError
  static std::string parse_chat_response(const std::string &response);

 private:
  std::string endpoint_;
  std::string model_;
  bool enable_thinking_;
  long request_timeout_seconds_;

  std::string build_url(const std::string &path) const;
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace sage_core
