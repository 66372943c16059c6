#pragma once

#include <string>
#include <vector>

namespace docmind_core {

class EmbeddingUnavailableError : public std::exception {
 public:
  explicit EmbeddingUnavailableError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class EmbeddingProvider
 * @brief Maps text to vectors of a fixed dimension.
 *
 * Implementations are constructed explicitly, initialized before first use and
 * shut down by their owner. embed() may be called from several threads at once.
 */
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual void initialize() {}
  virtual void shutdown() {}

  /**
   * @brief Embeds one text.
   * @throw EmbeddingUnavailableError if the provider cannot produce a vector.
   */
  virtual std::vector<float> embed(const std::string &text) = 0;

  // Embeds each text in order; fails as a whole if any single text fails
  virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts);

  virtual size_t dimension() const = 0;

  /**
   * @brief Like embed(), but yields a zero vector of dimension() on failure.
   *
   * The zero vector keeps the index well-formed at the cost of the chunk never
   * ranking above any other.
   */
  std::vector<float> embed_or_zero(const std::string &text);
};

}  // namespace docmind_core
