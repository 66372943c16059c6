#pragma once

#include <string>
#include <vector>

namespace docmind_core {

/**
 * @class TextChunker
 * @brief Splits extracted document text into overlapping chunks for embedding.
 *
 * Windows of chunk_size code points are advanced through the text. A window that
 * stops short of the end of the text is pulled back to the last sentence
 * terminator ('.') or, failing that, the last line break, provided the boundary
 * lies in the second half of the window. Each chunk is trimmed and chunks of 50
 * code points or fewer are dropped. The next window starts overlap code points
 * before the previous one ended.
 */
class TextChunker {
 public:
  static constexpr size_t DEFAULT_CHUNK_SIZE = 500;
  static constexpr size_t DEFAULT_OVERLAP = 100;
  static constexpr size_t MIN_CHUNK_LENGTH = 50;

  /**
   * @brief Splits text into ordered chunks.
   * @param text UTF-8 text. Invalid sequences are replaced rather than rejected.
   * @param chunk_size Maximum window length in code points.
   * @param overlap Number of code points shared between consecutive windows.
   * @return The chunks in document order. A text of at most chunk_size code points
   *         yields exactly one chunk, the trimmed text.
   * @throw std::invalid_argument if chunk_size is 0 or overlap >= chunk_size.
   */
  static std::vector<std::string> split(const std::string& text,
                                        size_t chunk_size = DEFAULT_CHUNK_SIZE,
                                        size_t overlap = DEFAULT_OVERLAP);
};

}  // namespace docmind_core
