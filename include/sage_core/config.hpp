#pragma once

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace sage_core {

class Config {
 public:
  static constexpr const char* DEFAULT_CONFIG_FILE = "sagerc.json";
  static constexpr const char* CONFIG_ENV_VAR = "SAGE_CONFIG";

  std::string api_base_url;
  std::string vector_db_path;
  int db_pool_size;

  // Ollama
  std::string ollama_url;
  std::string embedding_model;
  std::string chat_model;
  bool enable_thinking;
  double temperature;

  // RAG pipeline
  int chunk_size;
  int chunk_overlap;
  int max_results;
  double similarity_threshold;
  int embedding_batch_size;
  int embedding_cache_capacity;  // 0 disables eviction
  int max_file_size_mb;
  std::string personality_file;
  int query_timeout_seconds;
  std::string default_collection;

  // $SAGE_CONFIG when set, sagerc.json otherwise
  static std::string resolve_path() {
    const char* env_path = std::getenv(CONFIG_ENV_VAR);
    if (env_path && *env_path) {
      return env_path;
    }
    return DEFAULT_CONFIG_FILE;
  }

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Like from_file, but a missing file yields the defaults
  static Config load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
      std::cout << "Config file " << filename << " not found, using defaults" << std::endl;
      return from_json(nlohmann::json::object());
    }
    return from_file(filename);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }
    Config config;

    // Apply defaults when keys are missing
    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
    config.vector_db_path = json_config.value("vector_db_path", std::string("./data/vectors.db"));
    config.db_pool_size = number_or(json_config, "db_pool_size", 4);

    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));
    config.chat_model = json_config.value("chat_model", std::string("qwen3:1.7b"));
    config.enable_thinking = json_config.value("enable_thinking", false);
    config.temperature = number_or(json_config, "temperature", 0.7);

    config.chunk_size = number_or(json_config, "chunk_size", 1000);
    config.chunk_overlap = number_or(json_config, "chunk_overlap", 200);
    config.max_results = number_or(json_config, "max_results", 5);
    config.similarity_threshold = number_or(json_config, "similarity_threshold", 0.3);
    config.embedding_batch_size = number_or(json_config, "embedding_batch_size", 50);
    config.embedding_cache_capacity = number_or(json_config, "embedding_cache_capacity", 10000);
    config.max_file_size_mb = number_or(json_config, "max_file_size_mb", 50);
    config.personality_file =
        json_config.value("personality_file", std::string("./rag-personality.txt"));
    config.query_timeout_seconds = number_or(json_config, "query_timeout_seconds", 300);
    config.default_collection = json_config.value("default_collection", std::string("default"));

    config.validate();
    return config;
  }

  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    if (vector_db_path.empty()) {
      throw std::runtime_error("vector_db_path cannot be empty");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (chat_model.empty()) {
      throw std::runtime_error("chat_model cannot be empty");
    }
    if (temperature < 0.0 || temperature > 2.0) {
      throw std::runtime_error("temperature must be between 0 and 2");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be at least 0 and less than chunk_size");
    }
    if (max_results <= 0) {
      throw std::runtime_error("max_results must be greater than 0");
    }
    if (similarity_threshold < 0.0 || similarity_threshold > 1.0) {
      throw std::runtime_error("similarity_threshold must be between 0 and 1");
    }
    if (embedding_batch_size <= 0) {
      throw std::runtime_error("embedding_batch_size must be greater than 0");
    }
    if (embedding_cache_capacity < 0) {
      throw std::runtime_error("embedding_cache_capacity cannot be negative");
    }
    if (max_file_size_mb <= 0) {
      throw std::runtime_error("max_file_size_mb must be greater than 0");
    }
    if (query_timeout_seconds <= 0) {
      throw std::runtime_error("query_timeout_seconds must be greater than 0");
    }
    if (default_collection.empty()) {
      throw std::runtime_error("default_collection cannot be empty");
    }
  }

 private:
  // Wrong-typed values fall back to the default with a warning
  template <typename T>
  static T number_or(const nlohmann::json& json_config, const char* key, T fallback) {
    auto it = json_config.find(key);
    if (it == json_config.end() || it->is_null()) {
      return fallback;
    }
    if (!it->is_number()) {
      std::cerr << "Warning: config key '" << key << "' is not a number, using default"
                << std::endl;
      return fallback;
    }
    return it->get<T>();
  }
};

}  // namespace sage_core
