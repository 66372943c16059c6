#include "docmind_core/retrieval/retriever.hpp"

#include <algorithm>
#include <iostream>

#include "docmind_core/llm/embedding_provider.hpp"

namespace docmind_core {

Retriever::Retriever(std::shared_ptr<EmbeddingProvider> embedding_provider,
                     std::shared_ptr<const VectorIndex> vector_index, float min_similarity)
    : embedding_provider_(std::move(embedding_provider)),
      vector_index_(std::move(vector_index)),
      min_similarity_(min_similarity) {}

MetadataFilter Retriever::make_filter(const std::optional<std::string> &document_filter,
                                      const std::optional<std::string> &owner_filter) {
  if (!document_filter && !owner_filter) {
    return nullptr;
  }
  return [document_filter, owner_filter](const IndexMetadata &metadata) {
    if (document_filter && metadata.document_id != *document_filter) {
      return false;
    }
    if (owner_filter && metadata.owner_id != *owner_filter) {
      return false;
    }
    return true;
  };
}

std::vector<SearchResult> Retriever::retrieve(const std::string &query_text, int k,
                                              const std::optional<std::string> &document_filter,
                                              const std::optional<std::string> &owner_filter) const {
  std::vector<float> query_vector;
  try {
    query_vector = embedding_provider_->embed(query_text);
  } catch (const EmbeddingUnavailableError &e) {
    std::cerr << "Retriever: query embedding failed, returning no results: " << e.what()
              << std::endl;
    return {};
  }

  std::vector<SearchResult> results =
      vector_index_->search(query_vector, k, make_filter(document_filter, owner_filter));

  results.erase(std::remove_if(results.begin(), results.end(),
                               [this](const SearchResult &result) {
                                 return result.similarity <= min_similarity_;
                               }),
                results.end());
  return results;
}

}  // namespace docmind_core
