#include "docmind_core/services/compression_service.hpp"

#include <zstd.h>

namespace docmind_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }
  if (compression_level < ZSTD_minCLevel() || compression_level > ZSTD_maxCLevel()) {
    throw CompressionError("Invalid zstd compression level: " + std::to_string(compression_level));
  }

  std::vector<char> compressed(ZSTD_compressBound(data.size()));
  const size_t compressed_size = ZSTD_compress(compressed.data(), compressed.size(), data.data(),
                                               data.size(), compression_level);
  if (ZSTD_isError(compressed_size)) {
    throw CompressionError("ZSTD compression failed: " +
                           std::string(ZSTD_getErrorName(compressed_size)));
  }

  compressed.resize(compressed_size);
  return compressed;
}

std::string CompressionService::decompress(const std::vector<char> &compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  const unsigned long long content_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("Failed to get decompressed size or data is not zstd format.");
  }

  std::string decompressed(content_size, '\0');
  const size_t actual_size = ZSTD_decompress(decompressed.data(), decompressed.size(),
                                             compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(actual_size)) {
    throw CompressionError("ZSTD decompression failed: " +
                           std::string(ZSTD_getErrorName(actual_size)));
  }
  if (actual_size != content_size) {
    throw CompressionError("ZSTD decompression produced " + std::to_string(actual_size) +
                           " bytes, expected " + std::to_string(content_size));
  }

  return decompressed;
}

}  // namespace docmind_core
