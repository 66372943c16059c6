#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "docmind_core/db/database_manager.hpp"
#include "docmind_core/db/db_error.hpp"
#include "docmind_core/index/vector_index.hpp"
#include "docmind_core/types/chunk.hpp"
#include "docmind_core/types/document.hpp"

namespace docmind_core {

class DocumentStoreError : public DbError {
 public:
  using DbError::DbError;
};

struct CorpusStats {
  int total_documents = 0;
  // Distinct document owners
  int total_owners = 0;
  int total_chunks = 0;
  int recent_uploads = 0;
};

// Index metadata for one chunk of a document
IndexMetadata index_metadata_for(const DocumentSummary &document, int chunk_index);

/**
 * @class DocumentStore
 * @brief Persists documents and their embedded chunks in the encrypted database.
 *
 * Document text and chunk text are stored zstd-compressed, chunk vectors as
 * raw float blobs. The in-memory VectorIndex is rebuilt from this store at
 * startup through load_index_entries().
 */
class DocumentStore {
 public:
  explicit DocumentStore(DatabaseManager &db_manager);

  DocumentStore(const DocumentStore &) = delete;
  DocumentStore &operator=(const DocumentStore &) = delete;

  // Inserts the document row and every chunk in one transaction
  void save_document(const Document &document, const std::vector<Chunk> &chunks);

  std::optional<DocumentSummary> get_document(const std::string &document_id);

  // Newest first
  std::vector<DocumentSummary> list_documents(const std::string &owner_id);

  // Id of the owner's document with this content hash, if any
  std::optional<std::string> find_by_hash(const std::string &owner_id,
                                          const std::string &content_hash);

  std::optional<std::string> get_content(const std::string &document_id);

  // Returns false if the document did not exist. Chunks cascade.
  bool delete_document(const std::string &document_id);

  // Counts across every owner; recent_uploads counts documents uploaded at or after `since`
  CorpusStats corpus_stats(std::chrono::system_clock::time_point since);

  // Every persisted chunk as an index entry, grouped by document in chunk order
  std::vector<IndexEntry> load_index_entries();

 private:
  DatabaseManager &db_manager_;
};

}  // namespace docmind_core
