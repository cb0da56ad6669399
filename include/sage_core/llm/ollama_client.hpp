#pragma once

#include <string>
#include <vector>

#include "sage_core/embeddings/embedding_backend.hpp"
#include "sage_core/errors.hpp"

namespace sage_core {

class OllamaError : public EmbeddingError {
 public:
  using EmbeddingError::EmbeddingError;
};

// Embedding backend served by a local Ollama instance
class OllamaClient : public EmbeddingBackend {
 public:
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // Verifies the server is reachable; the model itself is loaded by Ollama on first use
  void load() override;

  std::vector<float> embed(const std::string &text) override;

  std::string model_name() const override {
    return embedding_model_;
  }

  virtual bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;
};

}  // namespace sage_core
