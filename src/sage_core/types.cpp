#include "sage_core/types.hpp"

namespace sage_core {

std::string document_type_tag(FileType type) {
  switch (type) {
    case FileType::Text:
      return "txt";
    case FileType::Markdown:
      return "md";
    default:
      return "unknown";
  }
}

FileType file_type_from_tag(const std::string& tag) {
  if (tag == "txt")
    return FileType::Text;
  if (tag == "md" || tag == "markdown")
    return FileType::Markdown;
  return FileType::Unknown;
}

namespace {

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
  if (value) {
    j[key] = *value;
  }
}

template <typename T>
std::optional<T> get_optional(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

}  // namespace

void to_json(nlohmann::json& j, const ChunkMetadata& metadata) {
  j = nlohmann::json{{"source", metadata.source},
                     {"chunkIndex", metadata.chunk_index},
                     {"totalChunks", metadata.total_chunks}};
  put_optional(j, "page", metadata.page);
  put_optional(j, "documentType", metadata.document_type);
  put_optional(j, "title", metadata.title);
  put_optional(j, "fileSize", metadata.file_size);
  put_optional(j, "fileName", metadata.file_name);
}

void from_json(const nlohmann::json& j, ChunkMetadata& metadata) {
  metadata.source = j.value("source", std::string());
  metadata.chunk_index = j.value("chunkIndex", 0);
  metadata.total_chunks = j.value("totalChunks", 0);
  metadata.page = get_optional<int>(j, "page");
  metadata.document_type = get_optional<std::string>(j, "documentType");
  metadata.title = get_optional<std::string>(j, "title");
  metadata.file_size = get_optional<std::int64_t>(j, "fileSize");
  metadata.file_name = get_optional<std::string>(j, "fileName");
}

DocumentMetadata document_metadata_from_json(const nlohmann::json& j) {
  DocumentMetadata metadata;
  if (!j.is_object()) {
    return metadata;
  }
  metadata.source = get_optional<std::string>(j, "source");
  metadata.page = get_optional<int>(j, "page");
  metadata.document_type = get_optional<std::string>(j, "documentType");
  metadata.title = get_optional<std::string>(j, "title");
  metadata.file_size = get_optional<std::int64_t>(j, "fileSize");
  metadata.file_name = get_optional<std::string>(j, "fileName");
  return metadata;
}

std::string make_chunk_id(const std::string& document_id, int chunk_index) {
  return document_id + "_chunk_" + std::to_string(chunk_index);
}

std::string document_id_from_chunk_id(const std::string& chunk_id) {
  auto pos = chunk_id.rfind("_chunk_");
  if (pos == std::string::npos || pos == 0) {
    return chunk_id;
  }
  return chunk_id.substr(0, pos);
}

void to_json(nlohmann::json& j, const SearchResult& result) {
  j = nlohmann::json{{"content", result.content},
                     {"score", result.score},
                     {"metadata", result.metadata}};
}

void to_json(nlohmann::json& j, const QueryResponse& response) {
  j = nlohmann::json{{"answer", response.answer},
                     {"sources", response.sources},
                     {"processingTime", response.processing_time_ms}};
}

void to_json(nlohmann::json& j, const IndexResult& result) {
  j = nlohmann::json{{"documentId", result.document_id},
                     {"chunksCount", result.chunk_count},
                     {"processingTime", result.processing_time_ms}};
}

void to_json(nlohmann::json& j, const DocumentInfo& document) {
  j = nlohmann::json{{"id", document.id},
                     {"fileName", document.file_name},
                     {"chunkCount", document.chunk_count}};
  put_optional(j, "title", document.title);
  put_optional(j, "fileSize", document.file_size);
  put_optional(j, "documentType", document.document_type);
}

void to_json(nlohmann::json& j, const CollectionInfo& collection) {
  j = nlohmann::json{{"name", collection.name},
                     {"documentCount", collection.document_count},
                     {"chunkCount", collection.chunk_count}};
  if (collection.documents) {
    j["documents"] = *collection.documents;
  }
}

}  // namespace sage_core
