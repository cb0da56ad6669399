#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdio>
#include <cstdlib>
#include <unistd.h>

#include "sage_core/config.hpp"

using sage_core::Config;

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/sage_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5);  // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

}  // namespace

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:3030");
  EXPECT_EQ(cfg.vector_db_path, "./data/vectors.db");
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(cfg.chat_model, "qwen3:1.7b");
  EXPECT_FALSE(cfg.enable_thinking);
  EXPECT_DOUBLE_EQ(cfg.temperature, 0.7);
  EXPECT_EQ(cfg.chunk_size, 1000);
  EXPECT_EQ(cfg.chunk_overlap, 200);
  EXPECT_EQ(cfg.max_results, 5);
  EXPECT_DOUBLE_EQ(cfg.similarity_threshold, 0.3);
  EXPECT_EQ(cfg.embedding_batch_size, 50);
  EXPECT_EQ(cfg.query_timeout_seconds, 300);
  EXPECT_EQ(cfg.default_collection, "default");
}

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {{"api_base_url", "0.0.0.0:8080"},
                      {"vector_db_path", "/var/lib/sage/v.db"},
                      {"chat_model", "llama3"},
                      {"chunk_size", 500},
                      {"chunk_overlap", 50},
                      {"max_results", 8},
                      {"similarity_threshold", 0.25},
                      {"enable_thinking", true},
                      {"default_collection", "handbook"}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "0.0.0.0:8080");
  EXPECT_EQ(cfg.vector_db_path, "/var/lib/sage/v.db");
  EXPECT_EQ(cfg.chat_model, "llama3");
  EXPECT_EQ(cfg.chunk_size, 500);
  EXPECT_EQ(cfg.chunk_overlap, 50);
  EXPECT_EQ(cfg.max_results, 8);
  EXPECT_DOUBLE_EQ(cfg.similarity_threshold, 0.25);
  EXPECT_TRUE(cfg.enable_thinking);
  EXPECT_EQ(cfg.default_collection, "handbook");
}

TEST(ConfigTest, NonNumericValueFallsBackToDefault) {
  Config cfg = Config::from_json({{"max_results", "ten"}, {"temperature", nullptr}});
  EXPECT_EQ(cfg.max_results, 5);
  EXPECT_DOUBLE_EQ(cfg.temperature, 0.7);
}

TEST(ConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(Config::from_json({{"chunk_size", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"chunk_size", 100}, {"chunk_overlap", 100}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"similarity_threshold", 1.5}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"temperature", -0.1}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"query_timeout_seconds", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"db_pool_size", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"chat_model", ""}}), std::runtime_error);
  EXPECT_THROW(Config::from_json(nlohmann::json::array()), std::runtime_error);
}

TEST(ConfigTest, ReadsConfigFile) {
  const std::string path = write_temp_file(R"({"chat_model": "mistral", "max_results": 3})");

  Config cfg = Config::from_file(path);
  EXPECT_EQ(cfg.chat_model, "mistral");
  EXPECT_EQ(cfg.max_results, 3);

  remove_file(path);
}

TEST(ConfigTest, MalformedFileIsAnError) {
  const std::string path = write_temp_file("{ not json");
  EXPECT_THROW(Config::from_file(path), std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, MissingFileIsAnErrorForFromFileOnly) {
  EXPECT_THROW(Config::from_file("/nonexistent/sagerc.json"), std::runtime_error);

  Config cfg = Config::load("/nonexistent/sagerc.json");
  EXPECT_EQ(cfg.chat_model, "qwen3:1.7b");
}

TEST(ConfigTest, ResolvePathHonorsEnvironment) {
  unsetenv(Config::CONFIG_ENV_VAR);
  EXPECT_EQ(Config::resolve_path(), "sagerc.json");

  setenv(Config::CONFIG_ENV_VAR, "/etc/sage/custom.json", 1);
  EXPECT_EQ(Config::resolve_path(), "/etc/sage/custom.json");
  unsetenv(Config::CONFIG_ENV_VAR);
}
