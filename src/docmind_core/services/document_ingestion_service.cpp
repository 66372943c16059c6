#include "docmind_core/services/document_ingestion_service.hpp"

#include <future>
#include <iostream>
#include <stdexcept>

#include "docmind_core/chunking/text_chunker.hpp"
#include "docmind_core/utils/id_utils.hpp"
#include "docmind_core/utils/text_utils.hpp"

namespace docmind_core {

EmbeddingFailurePolicy embedding_failure_policy_from_string(const std::string &str) {
  if (str == "zero_vector") return EmbeddingFailurePolicy::ZeroVector;
  if (str == "abort") return EmbeddingFailurePolicy::Abort;
  throw std::invalid_argument("Unknown embedding failure policy: " + str);
}

DocumentIngestionService::DocumentIngestionService(
    std::shared_ptr<TextExtractorRegistry> extractor_registry,
    std::shared_ptr<EmbeddingProvider> embedding_provider,
    std::shared_ptr<VectorIndex> vector_index, std::shared_ptr<DocumentStore> document_store,
    std::shared_ptr<async::WorkerPool> worker_pool, std::shared_ptr<MetricsSink> metrics_sink,
    IngestionOptions options)
    : extractor_registry_(std::move(extractor_registry)),
      embedding_provider_(std::move(embedding_provider)),
      vector_index_(std::move(vector_index)),
      document_store_(std::move(document_store)),
      worker_pool_(std::move(worker_pool)),
      metrics_sink_(std::move(metrics_sink)),
      options_(options) {}

IngestionResult DocumentIngestionService::ingest(const IngestionRequest &request) {
  const TextExtractor &extractor = extractor_registry_->get_extractor_for(request.file_path);
  if (!std::filesystem::exists(request.file_path)) {
    throw TextExtractorError("File not found: " + request.file_path.string());
  }

  ExtractionResult extraction = extractor.extract(request.file_path);
  const std::string filename =
      request.filename.empty() ? request.file_path.filename().string() : request.filename;
  return ingest_extracted(request.owner_id, filename, extraction,
                          std::filesystem::file_size(request.file_path));
}

IngestionResult DocumentIngestionService::ingest_text(const std::string &owner_id,
                                                      const std::string &filename,
                                                      FileType file_type, const std::string &text,
                                                      size_t file_size) {
  ExtractionResult extraction;
  extraction.text = text;
  extraction.content_hash = TextExtractor::compute_content_hash(text);
  extraction.file_type = file_type;
  return ingest_extracted(owner_id, filename, extraction, file_size);
}

IngestionResult DocumentIngestionService::ingest_extracted(const std::string &owner_id,
                                                           const std::string &filename,
                                                           const ExtractionResult &extraction,
                                                           size_t file_size) {
  if (text::trim(extraction.text).empty()) {
    throw UnsupportedFormatError("No text could be extracted from " + filename);
  }

  if (auto existing = document_store_->find_by_hash(owner_id, extraction.content_hash)) {
    std::cout << "DocumentIngestionService: " << filename << " duplicates document " << *existing
              << ", skipping" << std::endl;
    IngestionResult result;
    result.document_id = *existing;
    result.duplicate = true;
    if (auto summary = document_store_->get_document(*existing)) {
      result.chunk_count = summary->chunk_count;
    }
    return result;
  }

  std::vector<std::string> chunk_texts =
      TextChunker::split(extraction.text, options_.chunk_size, options_.chunk_overlap);
  if (chunk_texts.empty()) {
    throw UnsupportedFormatError("Document " + filename + " has no chunk long enough to index");
  }

  std::vector<std::vector<float>> vectors = embed_chunks(chunk_texts);

  Document document;
  document.id = generate_uuid_v4();
  document.owner_id = owner_id;
  document.filename = filename;
  document.file_type = extraction.file_type;
  document.file_size = file_size;
  document.content_hash = extraction.content_hash;
  document.uploaded_at = std::chrono::system_clock::now();
  document.chunk_count = static_cast<int>(chunk_texts.size());
  document.content = extraction.text;

  std::vector<Chunk> chunks;
  std::vector<IndexEntry> entries;
  chunks.reserve(chunk_texts.size());
  entries.reserve(chunk_texts.size());
  for (size_t i = 0; i < chunk_texts.size(); ++i) {
    const int chunk_index = static_cast<int>(i);
    chunks.push_back({document.id, chunk_index, chunk_texts[i], vectors[i]});
    entries.push_back({make_chunk_id(document.id, chunk_index), vectors[i],
                       index_metadata_for(document, chunk_index), chunk_texts[i]});
  }

  vector_index_->add_document(entries);
  try {
    document_store_->save_document(document, chunks);
  } catch (const std::exception &e) {
    std::cerr << "DocumentIngestionService: persisting " << document.id
              << " failed, removing it from the index: " << e.what() << std::endl;
    vector_index_->remove_document(document.id);
    throw;
  }

  if (metrics_sink_) {
    metrics_sink_->record_document_access(owner_id, document.id, DocumentAction::Upload);
  }

  std::cout << "DocumentIngestionService: indexed " << filename << " as " << document.id << " ("
            << chunks.size() << " chunks)" << std::endl;
  return {document.id, document.chunk_count, false};
}

std::vector<std::vector<float>> DocumentIngestionService::embed_chunks(
    const std::vector<std::string> &chunks) {
  const bool abort_on_failure =
      options_.embedding_failure_policy == EmbeddingFailurePolicy::Abort;

  std::vector<std::future<std::vector<float>>> futures;
  futures.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    futures.push_back(worker_pool_->submit([this, chunk, abort_on_failure]() {
      return abort_on_failure ? embedding_provider_->embed(chunk)
                              : embedding_provider_->embed_or_zero(chunk);
    }));
  }

  // Let every job finish before the first error propagates
  for (auto &future : futures) {
    future.wait();
  }
  std::vector<std::vector<float>> vectors;
  vectors.reserve(futures.size());
  for (auto &future : futures) {
    vectors.push_back(future.get());
  }
  return vectors;
}

}  // namespace docmind_core
