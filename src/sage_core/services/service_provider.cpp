#include "sage_core/services/service_provider.hpp"

#include "sage_core/chunking/text_chunker.hpp"
#include "sage_core/embeddings/embedding_cache.hpp"
#include "sage_core/embeddings/embedding_service.hpp"
#include "sage_core/extractors/content_extractor_factory.hpp"
#include "sage_core/llm/ollama_chat_client.hpp"
#include "sage_core/llm/ollama_client.hpp"
#include "sage_core/retrieval/retriever.hpp"
#include "sage_core/services/collection_service.hpp"
#include "sage_core/services/indexing_service.hpp"
#include "sage_core/services/personality_provider.hpp"
#include "sage_core/services/query_orchestrator.hpp"
#include "sage_core/store/sqlite_vector_store.hpp"

namespace sage_core {

std::shared_ptr<ServiceProvider> ServiceProvider::create(const Config& config,
                                                         DatabaseManager& db_manager) {
  auto embedding_backend =
      std::make_shared<OllamaClient>(config.ollama_url, config.embedding_model);
  auto cache = std::make_shared<EmbeddingCache>(config.embedding_cache_capacity);
  auto embeddings =
      std::make_shared<EmbeddingService>(embedding_backend, cache, config.embedding_batch_size);

  auto generator = std::make_shared<OllamaChatClient>(config.ollama_url, config.chat_model,
                                                      config.enable_thinking,
                                                      config.query_timeout_seconds);
  auto store = std::make_shared<SqliteVectorStore>(db_manager);
  auto extractors = std::make_shared<ContentExtractorFactory>(config.max_file_size_mb);

  auto indexing = std::make_shared<IndexingService>(
      embeddings, store, TextChunker(config.chunk_size, config.chunk_overlap), extractors);
  auto collections = std::make_shared<CollectionService>(store);

  auto retriever = std::make_shared<Retriever>(store, config.similarity_threshold);
  auto personality = std::make_shared<FilePersonalityProvider>(config.personality_file);
  OrchestratorSettings settings;
  settings.max_results = config.max_results;
  settings.generation.temperature = config.temperature;
  auto orchestrator =
      std::make_shared<QueryOrchestrator>(embeddings, retriever, generator, personality, settings);

  return std::make_shared<ServiceProvider>(embeddings, generator, store, indexing, collections,
                                           orchestrator,
                                           std::chrono::seconds(config.query_timeout_seconds));
}

}  // namespace sage_core
