#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sage_core/types/chunk.hpp"

namespace sage_core {

struct SearchResult {
  std::string content;
  double score = 0.0;  // similarity in [0, 1], higher is better
  ChunkMetadata metadata;
};

struct QueryRequest {
  std::string question;
  std::string collection;
  std::optional<int> limit;
  std::optional<double> threshold;
};

struct QueryResponse {
  std::string answer;
  std::vector<SearchResult> sources;
  std::int64_t processing_time_ms = 0;
};

struct IndexResult {
  std::string document_id;
  int chunk_count = 0;
  std::int64_t processing_time_ms = 0;
};

struct DocumentInfo {
  std::string id;
  std::string file_name;
  std::optional<std::string> title;
  int chunk_count = 0;
  std::optional<std::int64_t> file_size;
  std::optional<std::string> document_type;
};

struct CollectionInfo {
  std::string name;
  int document_count = 0;
  int chunk_count = 0;
  std::optional<std::vector<DocumentInfo>> documents;
};

// JSON views used by the HTTP API and the CLI
void to_json(nlohmann::json &j, const SearchResult &result);
void to_json(nlohmann::json &j, const QueryResponse &response);
void to_json(nlohmann::json &j, const IndexResult &result);
void to_json(nlohmann::json &j, const DocumentInfo &document);
void to_json(nlohmann::json &j, const CollectionInfo &collection);

}  // namespace sage_core
