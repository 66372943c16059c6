#include "docmind_core/index/vector_index.hpp"

#include <faiss/impl/IDSelector.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <map>
#include <mutex>

namespace docmind_core {

VectorIndex::VectorIndex(size_t dimension) : dimension_(dimension) {
  if (dimension == 0) {
    throw VectorIndexError("Vector index dimension must be greater than 0");
  }
  auto base_index = new faiss::IndexFlatIP(static_cast<faiss::idx_t>(dimension_));
  index_ = std::make_unique<faiss::IndexIDMap2>(base_index);
  index_->own_fields = true;
}

VectorIndex::~VectorIndex() = default;

int VectorIndex::candidate_count(int k) {
  // Clamp before multiplying so a huge k cannot overflow
  if (k > MAX_CANDIDATES / OVERSAMPLE_FACTOR) {
    return MAX_CANDIDATES;
  }
  return k * OVERSAMPLE_FACTOR;
}

void VectorIndex::validate_dimension(const std::vector<float> &vector,
                                     const std::string &what) const {
  if (vector.size() != dimension_) {
    throw DimensionMismatchError("Vector dimension mismatch for " + what + ". Expected " +
                                 std::to_string(dimension_) + " dimensions, got " +
                                 std::to_string(vector.size()) + ".");
  }
}

std::vector<float> VectorIndex::normalized(const std::vector<float> &vector) const {
  std::vector<float> copy = vector;
  // Zero vectors are left untouched and score 0 against everything
  faiss::fvec_renorm_L2(dimension_, 1, copy.data());
  return copy;
}

void VectorIndex::remove_labels(const std::vector<faiss::idx_t> &labels) {
  if (labels.empty()) {
    return;
  }
  index_->remove_ids(faiss::IDSelectorArray(labels.size(), labels.data()));
  for (faiss::idx_t label : labels) {
    auto it = entries_.find(label);
    if (it != entries_.end()) {
      labels_by_chunk_id_.erase(it->second.chunk_id);
      entries_.erase(it);
    }
  }
}

void VectorIndex::add(const IndexEntry &entry) {
  add_document({entry});
}

void VectorIndex::add_document(const std::vector<IndexEntry> &entries) {
  if (entries.empty()) {
    return;
  }

  // A chunk id repeated inside one batch keeps its last occurrence
  std::unordered_map<std::string, size_t> last_position;
  for (size_t i = 0; i < entries.size(); ++i) {
    validate_dimension(entries[i].vector, "chunk " + entries[i].chunk_id);
    last_position[entries[i].chunk_id] = i;
  }

  std::vector<const IndexEntry *> batch;
  std::vector<float> vectors;
  batch.reserve(last_position.size());
  vectors.reserve(last_position.size() * dimension_);
  for (size_t i = 0; i < entries.size(); ++i) {
    if (last_position[entries[i].chunk_id] != i) {
      continue;
    }
    batch.push_back(&entries[i]);
    std::vector<float> unit = normalized(entries[i].vector);
    vectors.insert(vectors.end(), unit.begin(), unit.end());
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);

  std::vector<faiss::idx_t> replaced;
  for (const IndexEntry *entry : batch) {
    auto it = labels_by_chunk_id_.find(entry->chunk_id);
    if (it != labels_by_chunk_id_.end()) {
      replaced.push_back(it->second);
    }
  }
  remove_labels(replaced);

  std::vector<faiss::idx_t> labels;
  labels.reserve(batch.size());
  for (const IndexEntry *entry : batch) {
    const faiss::idx_t label = next_label_++;
    labels.push_back(label);
    labels_by_chunk_id_[entry->chunk_id] = label;
    entries_[label] = StoredEntry{entry->chunk_id, entry->metadata, entry->content};
  }

  index_->add_with_ids(static_cast<faiss::idx_t>(batch.size()), vectors.data(), labels.data());
}

std::vector<SearchResult> VectorIndex::search(const std::vector<float> &query_vector, int k,
                                              const MetadataFilter &filter) const {
  validate_dimension(query_vector, "query");
  std::vector<SearchResult> results;
  if (k <= 0) {
    return results;
  }

  const std::vector<float> query = normalized(query_vector);

  std::shared_lock<std::shared_mutex> lock(mutex_);
  const faiss::idx_t total = index_->ntotal;
  if (total == 0) {
    return results;
  }

  const faiss::idx_t n = std::min<faiss::idx_t>(candidate_count(k), total);
  std::vector<float> scores(n);
  std::vector<faiss::idx_t> labels(n);
  index_->search(1, query.data(), n, scores.data(), labels.data());

  for (faiss::idx_t i = 0; i < n; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    auto it = entries_.find(labels[i]);
    if (it == entries_.end()) {
      continue;
    }
    const StoredEntry &stored = it->second;
    if (filter && !filter(stored.metadata)) {
      continue;
    }
    results.push_back(SearchResult{stored.chunk_id, stored.metadata, stored.content, scores[i]});
    if (results.size() == static_cast<size_t>(k)) {
      break;
    }
  }
  return results;
}

void VectorIndex::remove_document(const std::string &document_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::vector<faiss::idx_t> labels;
  for (const auto &[label, stored] : entries_) {
    if (stored.metadata.document_id == document_id) {
      labels.push_back(label);
    }
  }
  remove_labels(labels);
}

std::string VectorIndex::get_content(const std::string &document_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::map<int, const std::string *> ordered;
  for (const auto &[label, stored] : entries_) {
    if (stored.metadata.document_id == document_id) {
      ordered[stored.metadata.chunk_index] = &stored.content;
    }
  }

  std::string content;
  for (const auto &[chunk_index, text] : ordered) {
    if (!content.empty()) {
      content += "\n\n";
    }
    content += *text;
  }
  return content;
}

std::vector<IndexedDocument> VectorIndex::list_documents() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::map<std::string, IndexedDocument> grouped;
  for (const auto &[label, stored] : entries_) {
    auto [it, inserted] = grouped.try_emplace(stored.metadata.document_id);
    IndexedDocument &doc = it->second;
    if (inserted) {
      doc.document_id = stored.metadata.document_id;
      doc.owner_id = stored.metadata.owner_id;
      doc.filename = stored.metadata.filename;
      doc.file_type = stored.metadata.file_type;
      doc.uploaded_at = stored.metadata.uploaded_at;
    }
    ++doc.chunk_count;
  }

  std::vector<IndexedDocument> documents;
  documents.reserve(grouped.size());
  for (auto &[id, doc] : grouped) {
    documents.push_back(std::move(doc));
  }
  return documents;
}

size_t VectorIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace docmind_core
