#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sage_core {

// Positional and provenance metadata stored alongside every chunk
struct ChunkMetadata {
  std::string source;
  std::optional<int> page;
  int chunk_index = 0;
  int total_chunks = 0;
  std::optional<std::string> document_type;
  std::optional<std::string> title;
  std::optional<std::int64_t> file_size;
  std::optional<std::string> file_name;
};

struct Chunk {
  std::string id;
  std::string content;
  ChunkMetadata metadata;
};

// Caller-supplied document metadata merged into every chunk of an indexed document
struct DocumentMetadata {
  std::optional<std::string> source;
  std::optional<int> page;
  std::optional<std::string> document_type;
  std::optional<std::string> title;
  std::optional<std::int64_t> file_size;
  std::optional<std::string> file_name;
};

void to_json(nlohmann::json& j, const ChunkMetadata& metadata);
void from_json(const nlohmann::json& j, ChunkMetadata& metadata);

DocumentMetadata document_metadata_from_json(const nlohmann::json& j);

// Chunk ids have the form <document_id>_chunk_<index>
std::string make_chunk_id(const std::string& document_id, int chunk_index);
std::string document_id_from_chunk_id(const std::string& chunk_id);

}  // namespace sage_core
