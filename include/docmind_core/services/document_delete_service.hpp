#pragma once

#include <memory>
#include <string>

#include "docmind_core/db/document_store.hpp"
#include "docmind_core/index/vector_index.hpp"
#include "docmind_core/metrics/metrics_sink.hpp"
#include "docmind_core/services/document_info_service.hpp"

namespace docmind_core {

class DocumentDeleteService {
 public:
  DocumentDeleteService(std::shared_ptr<DocumentStore> document_store,
                        std::shared_ptr<VectorIndex> vector_index,
                        std::shared_ptr<MetricsSink> metrics_sink = nullptr);

  // Removes an owned document from the index and the store.
  // Throws DocumentNotFoundError or DocumentAccessError.
  void delete_document(const std::string &owner_id, const std::string &document_id);

 private:
  std::shared_ptr<DocumentStore> document_store_;
  std::shared_ptr<VectorIndex> vector_index_;
  std::shared_ptr<MetricsSink> metrics_sink_;
};

}  // namespace docmind_core
