#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sage_core {

struct ChatMessage {
  std::string role;  // "system", "user" or "assistant"
  std::string content;
};

struct GenerationOptions {
  double temperature = 0.7;
  std::optional<int> max_tokens;
};

// Receives one generated fragment; return false to stop the stream.
using FragmentCallback = std::function<bool(const std::string &)>;

class GenerationBackend {
 public:
  virtual ~GenerationBackend() = default;

  virtual bool health_check() = 0;

  virtual std::string generate(const std::vector<ChatMessage> &messages,
                               const GenerationOptions &options) = 0;

  // Blocks until the backend signals completion or on_fragment returns false.
  virtual void generate_stream(const std::vector<ChatMessage> &messages,
                               const GenerationOptions &options,
                               const FragmentCallback &on_fragment) = 0;

  virtual std::string model_name() const = 0;
};

}  // namespace sage_core
