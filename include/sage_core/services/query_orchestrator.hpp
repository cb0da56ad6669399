#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sage_core/embeddings/embedding_service.hpp"
#include "sage_core/llm/generation_backend.hpp"
#include "sage_core/retrieval/retriever.hpp"
#include "sage_core/services/personality_provider.hpp"
#include "sage_core/types/search.hpp"

namespace sage_core {

enum class QueryState { Idle, EmbeddingQuery, Searching, ContextAssembled, Generating, Completed, Failed };

std::string to_string(QueryState state);

using StateObserver = std::function<void(QueryState)>;

struct OrchestratorSettings {
  int max_results = 5;
  GenerationOptions generation;
};

/**
 * @class QueryOrchestrator
 * @brief Runs one RAG query end to end: embed the question, retrieve, assemble
 * context, and generate.
 *
 * A query that retrieves nothing completes with NO_RESULTS_ANSWER and no sources
 * instead of calling the generator. The overloads taking a timeout stop waiting
 * once it expires and throw QueryTimeoutError; backend calls already in flight
 * are left to finish on their own and their output is discarded.
 */
class QueryOrchestrator {
 public:
  static const char *const NO_RESULTS_ANSWER;

  QueryOrchestrator(std::shared_ptr<EmbeddingService> embeddings,
                    std::shared_ptr<Retriever> retriever,
                    std::shared_ptr<GenerationBackend> generator,
                    std::shared_ptr<PersonalityProvider> personality,
                    OrchestratorSettings settings = {});

  QueryOrchestrator(const QueryOrchestrator &) = delete;
  QueryOrchestrator &operator=(const QueryOrchestrator &) = delete;

  // Observes the state transitions of queries started after this call
  void set_state_observer(StateObserver observer);

  QueryResponse answer(const QueryRequest &request);
  QueryResponse answer(const QueryRequest &request, std::chrono::milliseconds timeout);

  // Fragments are delivered in generation order on the calling thread.
  // Returning false from on_fragment ends the stream early.
  void answer_stream(const QueryRequest &request, const FragmentCallback &on_fragment);
  void answer_stream(const QueryRequest &request,
                     const FragmentCallback &on_fragment,
                     std::chrono::milliseconds timeout);

  // Waits for the workers of timed-out queries, which keep running in the background.
  // True once none is left; false if the wait expired first.
  bool wait_for_workers(std::chrono::milliseconds timeout);

  // Throws ValidationError for a request that must not reach any backend
  static void validate(const QueryRequest &request);

  static std::string build_user_prompt(const std::string &context, const std::string &question);

  std::vector<ChatMessage> build_messages(const std::string &context,
                                          const std::string &question) const;

 private:
  struct Pipeline;
  struct QueryContext;
  struct WorkerTracker;

  std::shared_ptr<Pipeline> pipeline_;
  std::shared_ptr<WorkerTracker> workers_;
  StateObserver observer_;
};

}  // namespace sage_core
