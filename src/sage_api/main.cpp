#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

#include "sage_api/routes.hpp"
#include "sage_api/server.hpp"
#include "sage_core/config.hpp"
#include "sage_core/db/database_manager.hpp"
#include "sage_core/embeddings/embedding_service.hpp"
#include "sage_core/services/query_orchestrator.hpp"
#include "sage_core/services/service_provider.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main() {
  try {
    const std::string config_path = sage_core::Config::resolve_path();
    sage_core::Config config = sage_core::Config::load(config_path);

    std::cout << "Starting Sage API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Vector DB Path: " << config.vector_db_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Chat Model: " << config.chat_model << std::endl;

    auto &db_manager = sage_core::DatabaseManager::get_instance();
    db_manager.initialize(config.vector_db_path, config.db_pool_size);
    auto services = sage_core::ServiceProvider::create(config, db_manager);

    // Loading up front keeps the first query from paying for it
    try {
      services->get_embedding_service().initialize();
    } catch (const sage_core::EmbeddingError &e) {
      std::cerr << "Warning: " << e.what() << ". Embeddings will be retried on first use."
                << std::endl;
    }

    const auto [host, port] = sage_api::Server::parse_address(config.api_base_url);
    sage_api::Server server(host, port);
    sage_api::Routes routes(services, config.default_collection);
    routes.register_routes(server);

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/3] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/3] Waiting for timed-out queries to finish..." << std::endl;
    if (!services->get_query_orchestrator().wait_for_workers(std::chrono::seconds(5))) {
      std::cerr << "Warning: timed-out queries were still running at shutdown" << std::endl;
    }

    std::cout << "[3/3] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
