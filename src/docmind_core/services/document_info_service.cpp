#include "docmind_core/services/document_info_service.hpp"

#include <iostream>

#include "docmind_core/services/compression_service.hpp"

namespace docmind_core {

DocumentInfoService::DocumentInfoService(std::shared_ptr<DocumentStore> document_store,
                                         std::shared_ptr<const VectorIndex> vector_index,
                                         std::shared_ptr<MetricsSink> metrics_sink)
    : document_store_(std::move(document_store)),
      vector_index_(std::move(vector_index)),
      metrics_sink_(std::move(metrics_sink)) {}

std::vector<DocumentSummary> DocumentInfoService::list_documents(const std::string &owner_id) {
  return document_store_->list_documents(owner_id);
}

DocumentSummary DocumentInfoService::get_document(const std::string &owner_id,
                                                  const std::string &document_id) {
  std::optional<DocumentSummary> summary = document_store_->get_document(document_id);
  if (!summary) {
    throw DocumentNotFoundError(document_id);
  }
  if (summary->owner_id != owner_id) {
    throw DocumentAccessError(document_id);
  }
  return *summary;
}

std::string DocumentInfoService::get_content(const std::string &owner_id,
                                             const std::string &document_id) {
  get_document(owner_id, document_id);

  std::optional<std::string> content;
  try {
    content = document_store_->get_content(document_id);
  } catch (const CompressionError &e) {
    std::cerr << "DocumentInfoService: stored text of " << document_id
              << " is unreadable, rebuilding it from the index: " << e.what() << std::endl;
  }
  std::string text = content ? *content : vector_index_->get_content(document_id);

  if (metrics_sink_) {
    metrics_sink_->record_document_access(owner_id, document_id, DocumentAction::View);
  }
  return text;
}

CorpusStats DocumentInfoService::corpus_stats() {
  return document_store_->corpus_stats(std::chrono::system_clock::now() - RECENT_UPLOAD_WINDOW);
}

}  // namespace docmind_core
