#pragma once

#include <chrono>
#include <memory>

#include "sage_core/config.hpp"

namespace sage_core {
class DatabaseManager;
class EmbeddingService;
class GenerationBackend;
class VectorStore;
class IndexingService;
class CollectionService;
class QueryOrchestrator;
}  // namespace sage_core

namespace sage_core {

// Owns the wired service graph shared by the HTTP server and the CLI
class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<EmbeddingService> embeddings,
                  std::shared_ptr<GenerationBackend> generator,
                  std::shared_ptr<VectorStore> store,
                  std::shared_ptr<IndexingService> indexing,
                  std::shared_ptr<CollectionService> collections,
                  std::shared_ptr<QueryOrchestrator> orchestrator,
                  std::chrono::seconds query_timeout)
      : embeddings_(std::move(embeddings)),
        generator_(std::move(generator)),
        store_(std::move(store)),
        indexing_(std::move(indexing)),
        collections_(std::move(collections)),
        orchestrator_(std::move(orchestrator)),
        query_timeout_(query_timeout) {}

  // Builds Ollama clients, the SQLite vector store and every service from config.
  // The database manager must already be initialized.
  static std::shared_ptr<ServiceProvider> create(const Config& config, DatabaseManager& db_manager);

  EmbeddingService& get_embedding_service() {
    return *embeddings_;
  }
  GenerationBackend& get_generation_backend() {
    return *generator_;
  }
  VectorStore& get_vector_store() {
    return *store_;
  }
  IndexingService& get_indexing_service() {
    return *indexing_;
  }
  CollectionService& get_collection_service() {
    return *collections_;
  }
  QueryOrchestrator& get_query_orchestrator() {
    return *orchestrator_;
  }
  std::chrono::seconds query_timeout() const {
    return query_timeout_;
  }

 private:
  std::shared_ptr<EmbeddingService> embeddings_;
  std::shared_ptr<GenerationBackend> generator_;
  std::shared_ptr<VectorStore> store_;
  std::shared_ptr<IndexingService> indexing_;
  std::shared_ptr<CollectionService> collections_;
  std::shared_ptr<QueryOrchestrator> orchestrator_;
  std::chrono::seconds query_timeout_;
};

}  // namespace sage_core
