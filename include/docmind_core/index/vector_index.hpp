#pragma once

#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "docmind_core/types/file.hpp"

namespace docmind_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A vector's length differs from the index dimension
class DimensionMismatchError : public VectorIndexError {
 public:
  explicit DimensionMismatchError(const std::string &message) : VectorIndexError(message) {}
};

// Filter metadata denormalized onto every chunk entry
struct IndexMetadata {
  std::string document_id;
  std::string owner_id;
  int chunk_index = 0;
  std::string filename;
  FileType file_type = FileType::Unknown;
  std::string uploaded_at;
};

struct IndexEntry {
  std::string chunk_id;
  std::vector<float> vector;
  IndexMetadata metadata;
  std::string content;
};

struct SearchResult {
  std::string chunk_id;
  IndexMetadata metadata;
  std::string content;
  // 1 - cosine distance, in [-1, 1]
  float similarity;
};

// One row per document, grouped from its chunk entries
struct IndexedDocument {
  std::string document_id;
  std::string owner_id;
  std::string filename;
  FileType file_type = FileType::Unknown;
  std::string uploaded_at;
  int chunk_count = 0;
};

using MetadataFilter = std::function<bool(const IndexMetadata &)>;

/**
 * @class VectorIndex
 * @brief In-memory cosine similarity index over chunk vectors.
 *
 * Vectors are L2-normalized and stored in a FAISS inner-product index, so the
 * inner product of a query with an entry is their cosine similarity. Entries
 * are keyed by chunk id; adding an existing id replaces the entry.
 *
 * Searches run concurrently under a shared lock. add, add_document and
 * remove_document take the exclusive lock for the in-memory mutation only, so a
 * search sees either none or all of a document added with add_document.
 */
class VectorIndex {
 public:
  static constexpr int MAX_CANDIDATES = 50;
  static constexpr int OVERSAMPLE_FACTOR = 4;

  explicit VectorIndex(size_t dimension);
  ~VectorIndex();

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  /**
   * @brief Upserts one entry.
   * @throw DimensionMismatchError if entry.vector has the wrong length.
   */
  void add(const IndexEntry &entry);

  /**
   * @brief Upserts a batch of entries, normally every chunk of one document.
   *
   * Every vector is validated before the index is touched; on a mismatch
   * nothing is added.
   * @throw DimensionMismatchError if any vector has the wrong length.
   */
  void add_document(const std::vector<IndexEntry> &entries);

  /**
   * @brief Returns up to k entries most similar to the query, best first.
   *
   * min(4k, 50) nearest candidates are fetched before the filter is applied,
   * then the survivors are truncated to k.
   * @throw DimensionMismatchError if the query vector has the wrong length.
   */
  std::vector<SearchResult> search(const std::vector<float> &query_vector, int k,
                                   const MetadataFilter &filter = nullptr) const;

  // Removes every entry of the document. Removing an unknown document is a no-op.
  void remove_document(const std::string &document_id);

  // Chunks of the document in chunk order joined by a blank line; empty if unknown
  std::string get_content(const std::string &document_id) const;

  std::vector<IndexedDocument> list_documents() const;

  size_t size() const;
  size_t dimension() const {
    return dimension_;
  }

  static int candidate_count(int k);

 private:
  struct StoredEntry {
    std::string chunk_id;
    IndexMetadata metadata;
    std::string content;
  };

  void validate_dimension(const std::vector<float> &vector, const std::string &what) const;
  std::vector<float> normalized(const std::vector<float> &vector) const;
  // Caller holds the exclusive lock
  void remove_labels(const std::vector<faiss::idx_t> &labels);

  size_t dimension_;
  std::unique_ptr<faiss::IndexIDMap2> index_;
  std::unordered_map<faiss::idx_t, StoredEntry> entries_;
  std::unordered_map<std::string, faiss::idx_t> labels_by_chunk_id_;
  faiss::idx_t next_label_ = 0;
  mutable std::shared_mutex mutex_;
};

}  // namespace docmind_core
