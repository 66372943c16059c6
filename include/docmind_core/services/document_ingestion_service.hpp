#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "docmind_core/async/worker_pool.hpp"
#include "docmind_core/db/document_store.hpp"
#include "docmind_core/extractors/text_extractor_registry.hpp"
#include "docmind_core/index/vector_index.hpp"
#include "docmind_core/llm/embedding_provider.hpp"
#include "docmind_core/metrics/metrics_sink.hpp"

namespace docmind_core {

enum class EmbeddingFailurePolicy {
  // Index the chunk under a zero vector and log the failure
  ZeroVector,
  // Fail the whole upload; nothing is indexed or persisted
  Abort
};

EmbeddingFailurePolicy embedding_failure_policy_from_string(const std::string &str);

struct IngestionOptions {
  size_t chunk_size = 500;
  size_t chunk_overlap = 100;
  EmbeddingFailurePolicy embedding_failure_policy = EmbeddingFailurePolicy::ZeroVector;
};

struct IngestionRequest {
  std::filesystem::path file_path;
  // Display name; the file name of file_path when empty
  std::string filename;
  std::string owner_id;
};

struct IngestionResult {
  std::string document_id;
  int chunk_count = 0;
  // True when the owner already had a document with identical text
  bool duplicate = false;
};

/**
 * @class DocumentIngestionService
 * @brief The upload write path: extract, chunk, embed, index and persist.
 *
 * Chunks are embedded concurrently on the worker pool and collected before a
 * single VectorIndex::add_document, so a search never sees half a document.
 * If persisting fails after indexing, the document is removed from the index
 * again before the error propagates.
 */
class DocumentIngestionService {
 public:
  DocumentIngestionService(std::shared_ptr<TextExtractorRegistry> extractor_registry,
                           std::shared_ptr<EmbeddingProvider> embedding_provider,
                           std::shared_ptr<VectorIndex> vector_index,
                           std::shared_ptr<DocumentStore> document_store,
                           std::shared_ptr<async::WorkerPool> worker_pool,
                           std::shared_ptr<MetricsSink> metrics_sink,
                           IngestionOptions options = {});

  /**
   * @throw UnsupportedFormatError if the extension is unknown or the file yields no text.
   * @throw TextExtractorError if the file cannot be read.
   * @throw EmbeddingUnavailableError under the Abort policy.
   * @throw DimensionMismatchError or DocumentStoreError; nothing stays indexed.
   */
  IngestionResult ingest(const IngestionRequest &request);

  // Same pipeline for text that has already been extracted
  IngestionResult ingest_text(const std::string &owner_id, const std::string &filename,
                              FileType file_type, const std::string &text, size_t file_size);

 private:
  IngestionResult ingest_extracted(const std::string &owner_id, const std::string &filename,
                                   const ExtractionResult &extraction, size_t file_size);
  std::vector<std::vector<float>> embed_chunks(const std::vector<std::string> &chunks);

  std::shared_ptr<TextExtractorRegistry> extractor_registry_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<VectorIndex> vector_index_;
  std::shared_ptr<DocumentStore> document_store_;
  std::shared_ptr<async::WorkerPool> worker_pool_;
  std::shared_ptr<MetricsSink> metrics_sink_;
  IngestionOptions options_;
};

}  // namespace docmind_core
