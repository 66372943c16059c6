#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docmind_core/index/vector_index.hpp"

namespace docmind_core {

class EmbeddingProvider;

class Retriever {
 public:
  /**
   * @param min_similarity Results must score strictly above this. The default
   *        of -1.0 keeps every result.
   */
  Retriever(std::shared_ptr<EmbeddingProvider> embedding_provider,
            std::shared_ptr<const VectorIndex> vector_index, float min_similarity = -1.0f);

  /**
   * @brief Embeds the query and returns at most k matching chunks, best first.
   *
   * document_filter and owner_filter, when present, must both match. An
   * embedding failure yields an empty result rather than an error.
   * @throw DimensionMismatchError if the provider and index disagree on dimension.
   */
  std::vector<SearchResult> retrieve(const std::string &query_text, int k,
                                     const std::optional<std::string> &document_filter = std::nullopt,
                                     const std::optional<std::string> &owner_filter = std::nullopt) const;

  static MetadataFilter make_filter(const std::optional<std::string> &document_filter,
                                    const std::optional<std::string> &owner_filter);

 private:
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<const VectorIndex> vector_index_;
  float min_similarity_;
};

}  // namespace docmind_core
