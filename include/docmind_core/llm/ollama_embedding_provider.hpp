#pragma once

#include <string>
#include <vector>

#include "docmind_core/llm/embedding_provider.hpp"

namespace docmind_core {

// Embeddings from an Ollama server's embedding model
class OllamaEmbeddingProvider : public EmbeddingProvider {
 public:
  OllamaEmbeddingProvider(const std::string &ollama_url, const std::string &embedding_model,
                          size_t dimension);
  ~OllamaEmbeddingProvider() override = default;

  OllamaEmbeddingProvider(const OllamaEmbeddingProvider &) = delete;
  OllamaEmbeddingProvider &operator=(const OllamaEmbeddingProvider &) = delete;

  // Points ollama-hpp at the server; throws EmbeddingUnavailableError if it is not running
  void initialize() override;

  std::vector<float> embed(const std::string &text) override;

  size_t dimension() const override {
    return dimension_;
  }

  /**
   * @brief Extracts the vector from an /api/embed reply body.
   *
   * Accepts {"embeddings": [[...]]} and {"embeddings": [...]}.
   * @throw EmbeddingUnavailableError if the body is malformed or holds no vector.
   */
  static std::vector<float> parse_embedding(const std::string &response_body);

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  size_t dimension_;
};

}  // namespace docmind_core
