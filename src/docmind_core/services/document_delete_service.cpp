#include "docmind_core/services/document_delete_service.hpp"

#include <iostream>

namespace docmind_core {

DocumentDeleteService::DocumentDeleteService(std::shared_ptr<DocumentStore> document_store,
                                             std::shared_ptr<VectorIndex> vector_index,
                                             std::shared_ptr<MetricsSink> metrics_sink)
    : document_store_(std::move(document_store)),
      vector_index_(std::move(vector_index)),
      metrics_sink_(std::move(metrics_sink)) {}

void DocumentDeleteService::delete_document(const std::string &owner_id,
                                            const std::string &document_id) {
  std::optional<DocumentSummary> summary = document_store_->get_document(document_id);
  if (!summary) {
    throw DocumentNotFoundError(document_id);
  }
  if (summary->owner_id != owner_id) {
    throw DocumentAccessError(document_id);
  }

  // A failed store delete leaves the index unchanged
  if (!document_store_->delete_document(document_id)) {
    throw DocumentNotFoundError(document_id);
  }
  vector_index_->remove_document(document_id);

  if (metrics_sink_) {
    metrics_sink_->record_document_access(owner_id, document_id, DocumentAction::Delete);
  }
  std::cout << "DocumentDeleteService: deleted " << summary->filename << " (" << document_id << ")"
            << std::endl;
}

}  // namespace docmind_core
