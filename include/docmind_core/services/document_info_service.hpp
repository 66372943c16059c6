#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "docmind_core/db/document_store.hpp"
#include "docmind_core/index/vector_index.hpp"
#include "docmind_core/metrics/metrics_sink.hpp"

namespace docmind_core {

class DocumentNotFoundError : public std::exception {
 public:
  explicit DocumentNotFoundError(const std::string &document_id)
      : message_("Document not found: " + document_id) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The document exists but belongs to another owner
class DocumentAccessError : public std::exception {
 public:
  explicit DocumentAccessError(const std::string &document_id)
      : message_("Access denied to document: " + document_id) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class DocumentInfoService {
 public:
  static constexpr std::chrono::hours RECENT_UPLOAD_WINDOW{24 * 7};

  DocumentInfoService(std::shared_ptr<DocumentStore> document_store,
                      std::shared_ptr<const VectorIndex> vector_index,
                      std::shared_ptr<MetricsSink> metrics_sink = nullptr);

  // The owner's documents, newest first
  std::vector<DocumentSummary> list_documents(const std::string &owner_id);

  // Throws DocumentNotFoundError or DocumentAccessError
  DocumentSummary get_document(const std::string &owner_id, const std::string &document_id);

  // Full text of an owned document. Falls back to the indexed chunks if the stored text is
  // missing or cannot be decompressed.
  std::string get_content(const std::string &owner_id, const std::string &document_id);

  // Store-wide counts; recent uploads are those within RECENT_UPLOAD_WINDOW
  CorpusStats corpus_stats();

 private:
  std::shared_ptr<DocumentStore> document_store_;
  std::shared_ptr<const VectorIndex> vector_index_;
  std::shared_ptr<MetricsSink> metrics_sink_;
};

}  // namespace docmind_core
