#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "docmind_api/config.hpp"
#include "docmind_api/routes.hpp"
#include "docmind_api/server.hpp"
#include "docmind_core/async/worker_pool.hpp"
#include "docmind_core/db/conversation_store.hpp"
#include "docmind_core/db/database_manager.hpp"
#include "docmind_core/db/document_store.hpp"
#include "docmind_core/extractors/text_extractor_registry.hpp"
#include "docmind_core/index/vector_index.hpp"
#include "docmind_core/llm/ollama_completion_provider.hpp"
#include "docmind_core/llm/ollama_embedding_provider.hpp"
#include "docmind_core/metrics/in_memory_metrics_sink.hpp"
#include "docmind_core/retrieval/response_synthesizer.hpp"
#include "docmind_core/retrieval/retriever.hpp"
#include "docmind_core/services/document_delete_service.hpp"
#include "docmind_core/services/document_info_service.hpp"
#include "docmind_core/services/document_ingestion_service.hpp"
#include "docmind_core/services/document_summary_service.hpp"
#include "docmind_core/services/query_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main() {
  try {
    const char *config_env = std::getenv("DOCMIND_CONFIG");
    const std::string config_path = config_env ? config_env : "docmindrc.json";
    docmind_api::Config config = docmind_api::Config::from_file(config_path);

    const char *db_key = std::getenv(config.db_key_env.c_str());
    if (!db_key || std::string(db_key).empty()) {
      throw std::runtime_error("Database key not set; export " + config.db_key_env);
    }

    std::cout << "Starting DocMind API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Metadata DB Path: " << config.metadata_db_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << " (" << config.embedding_dimension
              << " dimensions)" << std::endl;
    std::cout << "Completion Model: " << config.completion_model << std::endl;

    // --- 1. CORE COMPONENTS ---
    docmind_core::DatabaseManager db_manager;
    db_manager.initialize(config.metadata_db_path, db_key, /*pool_size*/ config.num_workers);
    auto document_store = std::make_shared<docmind_core::DocumentStore>(db_manager);
    auto conversation_store = std::make_shared<docmind_core::ConversationStore>(db_manager);

    auto embedding_provider = std::make_shared<docmind_core::OllamaEmbeddingProvider>(
        config.ollama_url, config.embedding_model, config.embedding_dimension);
    auto completion_provider = std::make_shared<docmind_core::OllamaCompletionProvider>(
        config.ollama_url, config.completion_model, config.fallback_models,
        std::chrono::seconds(config.synthesis_timeout_seconds));
    try {
      embedding_provider->initialize();
    } catch (const docmind_core::EmbeddingUnavailableError &e) {
      std::cerr << "Warning: embedding provider unavailable, uploads will use the "
                << config.embedding_failure_policy << " policy: " << e.what() << std::endl;
    }
    completion_provider->initialize();

    auto vector_index =
        std::make_shared<docmind_core::VectorIndex>(static_cast<size_t>(config.embedding_dimension));
    std::vector<docmind_core::IndexEntry> entries = document_store->load_index_entries();
    vector_index->add_document(entries);
    std::cout << "Vector index rebuilt with " << vector_index->size() << " chunks." << std::endl;

    auto metrics_sink = std::make_shared<docmind_core::InMemoryMetricsSink>();
    auto extractor_registry = std::make_shared<docmind_core::TextExtractorRegistry>();
    auto worker_pool =
        std::make_shared<docmind_core::async::WorkerPool>(static_cast<size_t>(config.num_workers));

    docmind_core::IngestionOptions ingestion_options;
    ingestion_options.chunk_size = static_cast<size_t>(config.chunk_size);
    ingestion_options.chunk_overlap = static_cast<size_t>(config.chunk_overlap);
    ingestion_options.embedding_failure_policy =
        docmind_core::embedding_failure_policy_from_string(config.embedding_failure_policy);

    docmind_core::CompletionOptions completion_options;
    completion_options.temperature = config.temperature;
    completion_options.max_tokens = config.max_tokens;
    completion_options.timeout = std::chrono::seconds(config.synthesis_timeout_seconds);

    auto ingestion_service = std::make_shared<docmind_core::DocumentIngestionService>(
        extractor_registry, embedding_provider, vector_index, document_store, worker_pool,
        metrics_sink, ingestion_options);
    auto info_service = std::make_shared<docmind_core::DocumentInfoService>(
        document_store, vector_index, metrics_sink);
    auto delete_service = std::make_shared<docmind_core::DocumentDeleteService>(
        document_store, vector_index, metrics_sink);
    auto summary_service =
        std::make_shared<docmind_core::DocumentSummaryService>(info_service, completion_provider);
    auto retriever = std::make_shared<docmind_core::Retriever>(
        embedding_provider, vector_index, static_cast<float>(config.min_similarity));
    auto synthesizer =
        std::make_shared<docmind_core::ResponseSynthesizer>(completion_provider, completion_options);
    auto query_service = std::make_shared<docmind_core::QueryService>(
        retriever, synthesizer, conversation_store, metrics_sink);

    std::string host = config.api_base_url.substr(0, config.api_base_url.find(':'));
    int port = std::stoi(config.api_base_url.substr(config.api_base_url.find(':') + 1));
    docmind_api::Server server(host, port, static_cast<unsigned int>(config.num_workers));
    docmind_api::Routes routes(ingestion_service, info_service, delete_service, summary_service,
                               query_service, conversation_store, metrics_sink);
    routes.register_routes(server);

    // --- 2. START BACKGROUND SERVICES ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    worker_pool->start();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/4] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/4] Stopping worker pool..." << std::endl;
    worker_pool->stop();

    std::cout << "[3/4] Shutting down model providers..." << std::endl;
    completion_provider->shutdown();
    embedding_provider->shutdown();

    std::cout << "[4/4] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
