#include "sage_core/services/query_orchestrator.hpp"

#include <atomic>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "sage_core/errors.hpp"
#include "sage_core/retrieval/context_assembler.hpp"
#include "sage_core/store/vector_store.hpp"

namespace sage_core {

const char *const QueryOrchestrator::NO_RESULTS_ANSWER =
    "I could not find relevant information in the available documents. Try rephrasing your "
    "question or be more specific.";

std::string to_string(QueryState state) {
  switch (state) {
    case QueryState::Idle:
      return "Idle";
    case QueryState::EmbeddingQuery:
      return "EmbeddingQuery";
    case QueryState::Searching:
      return "Searching";
    case QueryState::ContextAssembled:
      return "ContextAssembled";
    case QueryState::Generating:
      return "Generating";
    case QueryState::Completed:
      return "Completed";
    case QueryState::Failed:
      return "Failed";
    default:
      return "Unknown";
  }
}

// Per-query bookkeeping shared with a worker thread when a deadline is in play.
// Once Completed or Failed has been reported the observer is never called again.
struct QueryOrchestrator::QueryContext {
  explicit QueryContext(StateObserver obs) : observer(std::move(obs)) {}

  void notify(QueryState state) {
    std::lock_guard<std::mutex> lock(mtx);
    if (finished) {
      return;
    }
    finished = state == QueryState::Completed || state == QueryState::Failed;
    if (observer) {
      observer(state);
    }
  }

  StateObserver observer;
  std::mutex mtx;
  bool finished = false;
  std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
};

// Counts the detached workers that are still running
struct QueryOrchestrator::WorkerTracker {
  std::mutex mtx;
  std::condition_variable cv;
  int running = 0;

  void started() {
    std::lock_guard<std::mutex> lock(mtx);
    ++running;
  }

  void finished() {
    {
      std::lock_guard<std::mutex> lock(mtx);
      --running;
    }
    cv.notify_all();
  }

  // Runs body on a detached thread. The body and everything it captured are
  // destroyed before the worker counts as finished.
  template <typename Body>
  static void spawn(const std::shared_ptr<WorkerTracker> &tracker, Body body) {
    tracker->started();
    try {
      std::thread([tracker, body = std::move(body)]() mutable {
        {
          Body run = std::move(body);
          run();
        }
        tracker->finished();
      }).detach();
    } catch (const std::system_error &) {
      tracker->finished();
      throw;
    }
  }
};

// The collaborators, held by shared_ptr so an abandoned worker keeps them alive
struct QueryOrchestrator::Pipeline {
  std::shared_ptr<EmbeddingService> embeddings;
  std::shared_ptr<Retriever> retriever;
  std::shared_ptr<GenerationBackend> generator;
  std::shared_ptr<PersonalityProvider> personality;
  OrchestratorSettings settings;

  std::vector<ChatMessage> messages_for(const std::string &context,
                                        const std::string &question) const {
    return {{"system", personality->system_prompt()},
            {"user", build_user_prompt(context, question)}};
  }

  // Embeds the question and runs the tiered search
  std::vector<SearchResult> retrieve(const QueryRequest &request,
                                     RetrievalMode mode,
                                     QueryContext &ctx) const {
    ctx.notify(QueryState::EmbeddingQuery);
    const auto query_vector = embeddings->embed_query(request.question);

    ctx.notify(QueryState::Searching);
    return retriever->search(request.collection, query_vector,
                             request.limit.value_or(settings.max_results), request.threshold,
                             mode);
  }

  QueryResponse run_answer(const QueryRequest &request, QueryContext &ctx) const {
    try {
      QueryResponse response;
      response.sources = retrieve(request, RetrievalMode::SingleShot, ctx);

      if (response.sources.empty()) {
        std::cout << "No relevant chunks found for question in '" << request.collection << "'"
                  << std::endl;
        response.answer = NO_RESULTS_ANSWER;
      } else {
        const auto context = ContextAssembler::assemble(response.sources);
        ctx.notify(QueryState::ContextAssembled);

        ctx.notify(QueryState::Generating);
        response.answer =
            generator->generate(messages_for(context, request.question), settings.generation);
      }

      response.processing_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - ctx.started)
                                        .count();
      ctx.notify(QueryState::Completed);
      return response;
    } catch (const std::exception &e) {
      std::cerr << "Query failed: " << e.what() << std::endl;
      ctx.notify(QueryState::Failed);
      throw;
    }
  }

  void run_stream(const QueryRequest &request,
                  const FragmentCallback &on_fragment,
                  QueryContext &ctx) const {
    try {
      const auto sources = retrieve(request, RetrievalMode::Streaming, ctx);

      if (sources.empty()) {
        std::cout << "No relevant chunks found for question in '" << request.collection << "'"
                  << std::endl;
        on_fragment(NO_RESULTS_ANSWER);
        ctx.notify(QueryState::Completed);
        return;
      }

      const auto context = ContextAssembler::assemble(sources);
      ctx.notify(QueryState::ContextAssembled);

      ctx.notify(QueryState::Generating);
      generator->generate_stream(messages_for(context, request.question), settings.generation,
                                 on_fragment);
      ctx.notify(QueryState::Completed);
    } catch (const std::exception &e) {
      std::cerr << "Streaming query failed: " << e.what() << std::endl;
      ctx.notify(QueryState::Failed);
      throw;
    }
  }
};

namespace {

// Hands fragments from the worker thread to the caller's thread
struct FragmentChannel {
  std::mutex mtx;
  std::condition_variable cv;
  std::deque<std::string> fragments;
  bool done = false;
  std::exception_ptr error;
  std::atomic<bool> stop{false};
};

std::string timeout_message(std::chrono::milliseconds timeout) {
  return "Query timed out after " + std::to_string(timeout.count()) + " ms";
}

}  // namespace

QueryOrchestrator::QueryOrchestrator(std::shared_ptr<EmbeddingService> embeddings,
                                     std::shared_ptr<Retriever> retriever,
                                     std::shared_ptr<GenerationBackend> generator,
                                     std::shared_ptr<PersonalityProvider> personality,
                                     OrchestratorSettings settings)
    : pipeline_(std::make_shared<Pipeline>()), workers_(std::make_shared<WorkerTracker>()) {
  if (!embeddings || !retriever || !generator || !personality) {
    throw std::invalid_argument("QueryOrchestrator requires all collaborators");
  }
  pipeline_->embeddings = std::move(embeddings);
  pipeline_->retriever = std::move(retriever);
  pipeline_->generator = std::move(generator);
  pipeline_->personality = std::move(personality);
  pipeline_->settings = std::move(settings);
}

void QueryOrchestrator::set_state_observer(StateObserver observer) {
  observer_ = std::move(observer);
}

bool QueryOrchestrator::wait_for_workers(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(workers_->mtx);
  return workers_->cv.wait_for(lock, timeout, [this] { return workers_->running == 0; });
}

void QueryOrchestrator::validate(const QueryRequest &request) {
  if (request.question.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw ValidationError("Question must not be empty");
  }
  validate_collection_name(request.collection);
  if (request.limit && *request.limit <= 0) {
    throw ValidationError("Result limit must be positive");
  }
  if (request.threshold &&
      (!std::isfinite(*request.threshold) || *request.threshold < 0.0 || *request.threshold > 1.0)) {
    throw ValidationError("Similarity threshold must be between 0 and 1");
  }
}

std::string QueryOrchestrator::build_user_prompt(const std::string &context,
                                                 const std::string &question) {
  return "Context from documents:\n" + context + "\n\nQuestion: " + question +
         "\n\nAnswer the question using only the information from the context above.";
}

std::vector<ChatMessage> QueryOrchestrator::build_messages(const std::string &context,
                                                           const std::string &question) const {
  return pipeline_->messages_for(context, question);
}

QueryResponse QueryOrchestrator::answer(const QueryRequest &request) {
  validate(request);
  QueryContext ctx(observer_);
  return pipeline_->run_answer(request, ctx);
}

QueryResponse QueryOrchestrator::answer(const QueryRequest &request,
                                        std::chrono::milliseconds timeout) {
  validate(request);

  auto ctx = std::make_shared<QueryContext>(observer_);
  auto pipeline = pipeline_;
  auto task = std::make_shared<std::packaged_task<QueryResponse()>>(
      [pipeline, request, ctx] { return pipeline->run_answer(request, *ctx); });
  auto future = task->get_future();
  WorkerTracker::spawn(workers_, [task] { (*task)(); });

  if (future.wait_for(timeout) == std::future_status::timeout) {
    // Also silences the worker, which may still be running
    ctx->notify(QueryState::Failed);
    throw QueryTimeoutError(timeout_message(timeout));
  }
  return future.get();
}

void QueryOrchestrator::answer_stream(const QueryRequest &request,
                                      const FragmentCallback &on_fragment) {
  validate(request);
  QueryContext ctx(observer_);
  pipeline_->run_stream(request, on_fragment, ctx);
}

void QueryOrchestrator::answer_stream(const QueryRequest &request,
                                      const FragmentCallback &on_fragment,
                                      std::chrono::milliseconds timeout) {
  validate(request);

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto ctx = std::make_shared<QueryContext>(observer_);
  auto channel = std::make_shared<FragmentChannel>();
  auto pipeline = pipeline_;

  WorkerTracker::spawn(workers_, [pipeline, request, ctx, channel] {
    std::exception_ptr error;
    try {
      pipeline->run_stream(
          request,
          [channel](const std::string &fragment) {
            if (channel->stop.load()) {
              return false;
            }
            std::lock_guard<std::mutex> lock(channel->mtx);
            channel->fragments.push_back(fragment);
            channel->cv.notify_one();
            return true;
          },
          *ctx);
    } catch (const std::exception &) {
      error = std::current_exception();
    }
    std::lock_guard<std::mutex> lock(channel->mtx);
    channel->error = error;
    channel->done = true;
    channel->cv.notify_one();
  });

  std::unique_lock<std::mutex> lock(channel->mtx);
  while (true) {
    const bool ready = channel->cv.wait_until(
        lock, deadline, [&channel] { return !channel->fragments.empty() || channel->done; });
    if (!ready) {
      channel->stop = true;
      lock.unlock();
      ctx->notify(QueryState::Failed);
      throw QueryTimeoutError(timeout_message(timeout));
    }

    while (!channel->fragments.empty()) {
      std::string fragment = std::move(channel->fragments.front());
      channel->fragments.pop_front();

      // The callback runs without the lock so the worker can keep producing
      lock.unlock();
      const bool keep_going = on_fragment(fragment);
      lock.lock();
      if (!keep_going) {
        channel->stop = true;
        return;
      }
    }

    if (channel->done) {
      if (channel->error) {
        std::rethrow_exception(channel->error);
      }
      return;
    }
  }
}

}  // namespace sage_core
