#include "sage_core/services/indexing_service.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

#include "sage_core/errors.hpp"
#include "sage_core/util/uuid.hpp"

namespace sage_core {

IndexingService::IndexingService(std::shared_ptr<EmbeddingService> embeddings,
                                 std::shared_ptr<VectorStore> store,
                                 TextChunker chunker,
                                 std::shared_ptr<ContentExtractorFactory> extractors)
    : embeddings_(std::move(embeddings)),
      store_(std::move(store)),
      chunker_(std::move(chunker)),
      extractors_(extractors ? std::move(extractors) : std::make_shared<ContentExtractorFactory>()) {
  if (!embeddings_ || !store_) {
    throw std::invalid_argument("IndexingService requires an embedding service and a vector store");
  }
}

std::vector<Chunk> IndexingService::build_chunks(const std::string &document_id,
                                                 const std::string &text,
                                                 const DocumentMetadata &metadata) const {
  const auto pieces = chunker_.chunk(text);

  ChunkMetadata shared;
  shared.source = metadata.source.value_or(metadata.file_name.value_or("document"));
  shared.page = metadata.page.value_or(1);
  shared.total_chunks = static_cast<int>(pieces.size());
  shared.document_type = metadata.document_type.value_or("txt");
  shared.title = metadata.title;
  shared.file_size = metadata.file_size;
  shared.file_name = metadata.file_name;

  std::vector<Chunk> chunks;
  chunks.reserve(pieces.size());
  for (size_t i = 0; i < pieces.size(); ++i) {
    Chunk chunk;
    chunk.id = make_chunk_id(document_id, static_cast<int>(i));
    chunk.content = pieces[i];
    chunk.metadata = shared;
    chunk.metadata.chunk_index = static_cast<int>(i);
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

IndexResult IndexingService::index_document(const std::string &text,
                                            const std::string &collection,
                                            const DocumentMetadata &metadata) {
  validate_collection_name(collection);
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw ValidationError("Document text must not be empty");
  }

  const auto start_time = std::chrono::steady_clock::now();
  IndexResult result;
  result.document_id = generate_uuid_v4();

  const auto chunks = build_chunks(result.document_id, text, metadata);
  std::cout << "Indexing document " << result.document_id << " into collection '" << collection
            << "': " << chunks.size() << " chunks" << std::endl;

  std::vector<std::string> ids;
  std::vector<std::string> documents;
  std::vector<ChunkMetadata> metadatas;
  ids.reserve(chunks.size());
  documents.reserve(chunks.size());
  metadatas.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    ids.push_back(chunk.id);
    documents.push_back(chunk.content);
    metadatas.push_back(chunk.metadata);
  }

  const auto vectors = embeddings_->embed_batch(documents);
  store_->upsert(collection, ids, vectors, documents, metadatas);

  result.chunk_count = static_cast<int>(chunks.size());
  result.processing_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - start_time)
                                  .count();
  std::cout << "Document indexed successfully in " << result.processing_time_ms << "ms ("
            << result.chunk_count << " chunks)" << std::endl;
  return result;
}

IndexResult IndexingService::index_file(const std::filesystem::path &file_path,
                                        const std::string &collection,
                                        const DocumentMetadata &metadata) {
  validate_collection_name(collection);

  const ContentExtractor &extractor = extractors_->get_extractor_for(file_path);
  const ExtractionResult extraction = extractor.extract(file_path);
  std::cout << "Extracted " << extraction.text.size() << " bytes from " << file_path
            << " (sha256 " << extraction.content_hash.substr(0, 12) << ")" << std::endl;

  DocumentMetadata merged = metadata;
  merged.file_name = file_path.filename().string();
  merged.file_size = extraction.file_size;
  if (extraction.title) {
    merged.title = extraction.title;
  }
  if (!merged.source) {
    merged.source = merged.file_name;
  }
  if (!merged.document_type) {
    merged.document_type = document_type_tag(extraction.file_type);
  }

  return index_document(extraction.text, collection, merged);
}

}  // namespace sage_core
