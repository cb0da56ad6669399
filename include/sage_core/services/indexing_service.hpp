#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "sage_core/chunking/text_chunker.hpp"
#include "sage_core/embeddings/embedding_service.hpp"
#include "sage_core/extractors/content_extractor_factory.hpp"
#include "sage_core/store/vector_store.hpp"
#include "sage_core/types/chunk.hpp"
#include "sage_core/types/search.hpp"

namespace sage_core {

/**
 * @class IndexingService
 * @brief Chunks, embeds and stores documents under a fresh document id.
 */
class IndexingService {
 public:
  IndexingService(std::shared_ptr<EmbeddingService> embeddings,
                  std::shared_ptr<VectorStore> store,
                  TextChunker chunker,
                  std::shared_ptr<ContentExtractorFactory> extractors);

  IndexResult index_document(const std::string &text,
                             const std::string &collection,
                             const DocumentMetadata &metadata = {});

  // Extracts the file's text first; file name, size and title come from the file
  IndexResult index_file(const std::filesystem::path &file_path,
                         const std::string &collection,
                         const DocumentMetadata &metadata = {});

  // Chunk i gets id <document_id>_chunk_<i> and the shared document metadata
  std::vector<Chunk> build_chunks(const std::string &document_id,
                                  const std::string &text,
                                  const DocumentMetadata &metadata) const;

 private:
  std::shared_ptr<EmbeddingService> embeddings_;
  std::shared_ptr<VectorStore> store_;
  TextChunker chunker_;
  std::shared_ptr<ContentExtractorFactory> extractors_;
};

}  // namespace sage_core
