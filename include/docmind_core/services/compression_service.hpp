#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace docmind_core {

class CompressionError : public std::runtime_error {
 public:
  explicit CompressionError(const std::string &message) : std::runtime_error(message) {}
};

// Zstandard compression for document and chunk text at rest
class CompressionService {
 public:
  static constexpr int DEFAULT_LEVEL = 3;

  /**
   * @brief Compresses text into a single zstd frame.
   * @return The frame; empty input gives an empty result.
   * @throw CompressionError if zstd rejects the input or level.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = DEFAULT_LEVEL);

  /**
   * @brief Decompresses a frame produced by compress().
   * @throw CompressionError if the data is not a zstd frame with a known content size.
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace docmind_core
