#include "sage_core/llm/ollama_client.hpp"

#include <cmath>
#include <iostream>

#include "ollama.hpp"

namespace sage_core {

namespace {

// /api/embed answers {"embeddings": [[...]]}; older servers send a flat array
std::vector<float> first_embedding(const nlohmann::json &body) {
  auto it = body.find("embeddings");
  if (it == body.end() || !it->is_array()) {
    throw OllamaError("Embedding response has no 'embeddings' array");
  }
  const nlohmann::json &vector_json = (!it->empty() && it->front().is_array()) ? it->front() : *it;

  auto vector = vector_json.get<std::vector<float>>();
  if (vector.empty()) {
    throw OllamaError("Embedding model returned an empty vector");
  }
  for (float value : vector) {
    if (!std::isfinite(value)) {
      throw OllamaError("Embedding model returned a non-finite value");
    }
  }
  return vector;
}

}  // namespace

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {}

void OllamaClient::load() {
  if (!is_server_available()) {
    throw OllamaError("Ollama server is not running at " + ollama_url_);
  }
  std::cout << "Using embedding model " << embedding_model_ << " at " << ollama_url_ << std::endl;
}

// A fresh Ollama handle per call: a batch embeds several texts concurrently
std::vector<float> OllamaClient::embed(const std::string &text) {
  try {
    Ollama server(ollama_url_);
    ollama::response response = server.generate_embeddings(embedding_model_, text);
    return first_embedding(response.as_json());
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding request to " + embedding_model_ + " failed: " + e.what());
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response from " + embedding_model_ + ": " + e.what());
  }
}

bool OllamaClient::is_server_available() {
  Ollama server(ollama_url_);
  return server.is_running();
}

}  // namespace sage_core
