#include "docmind_core/llm/ollama_embedding_provider.hpp"

#include "ollama.hpp"

namespace docmind_core {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(const std::string &ollama_url,
                                                 const std::string &embedding_model,
                                                 size_t dimension)
    : ollama_url_(ollama_url), embedding_model_(embedding_model), dimension_(dimension) {}

void OllamaEmbeddingProvider::initialize() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw EmbeddingUnavailableError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaEmbeddingProvider::parse_embedding(const std::string &response_body) {
  try {
    auto json_response = nlohmann::json::parse(response_body);

    if (!json_response.contains("embeddings")) {
      throw EmbeddingUnavailableError("Response does not contain embedding field");
    }

    const auto &embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw EmbeddingUnavailableError("Embeddings field is not an array");
    }
    // Either an array of vectors (take the first) or a single vector
    std::vector<float> vector = (!embeddings.empty() && embeddings[0].is_array())
                                    ? embeddings[0].get<std::vector<float>>()
                                    : embeddings.get<std::vector<float>>();
    if (vector.empty()) {
      throw EmbeddingUnavailableError("Response contains an empty embedding");
    }
    return vector;

  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingUnavailableError("Malformed embedding response: " + std::string(e.what()));
  }
}

std::vector<float> OllamaEmbeddingProvider::embed(const std::string &text) {
  std::string body;
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    body = response.as_json_string();
  } catch (const ollama::exception &e) {
    throw EmbeddingUnavailableError("Embedding generation failed: " + std::string(e.what()));
  }
  return parse_embedding(body);
}

}  // namespace docmind_core
