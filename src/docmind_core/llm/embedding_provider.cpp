#include "docmind_core/llm/embedding_provider.hpp"

#include <iostream>

namespace docmind_core {

std::vector<std::vector<float>> EmbeddingProvider::embed_batch(
    const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    vectors.push_back(embed(text));
  }
  return vectors;
}

std::vector<float> EmbeddingProvider::embed_or_zero(const std::string &text) {
  try {
    return embed(text);
  } catch (const EmbeddingUnavailableError &e) {
    std::cerr << "Warning: embedding failed, using zero vector: " << e.what() << std::endl;
    return std::vector<float>(dimension(), 0.0f);
  }
}

}  // namespace docmind_core
