#include "docmind_core/chunking/text_chunker.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>

#include "docmind_core/utils/text_utils.hpp"

namespace docmind_core {

namespace {

// Position one past the last `marker` in [start, end) if it lies after `floor`
size_t boundary_after(const std::u32string& text, char32_t marker, size_t start, size_t end,
                      size_t floor) {
  for (size_t pos = end; pos > start; --pos) {
    if (text[pos - 1] == marker) {
      return (pos - 1 > floor) ? pos : std::u32string::npos;
    }
  }
  return std::u32string::npos;
}

}  // namespace

std::vector<std::string> TextChunker::split(const std::string& text, size_t chunk_size,
                                            size_t overlap) {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be greater than 0");
  }
  if (overlap >= chunk_size) {
    throw std::invalid_argument("overlap must be smaller than chunk_size");
  }

  const std::u32string code_points = text::to_code_points(text);
  const size_t length = code_points.size();

  if (length <= chunk_size) {
    return {text::trim(text::from_code_points(code_points))};
  }

  std::vector<std::string> chunks;
  size_t start = 0;
  while (start < length) {
    size_t end = start + chunk_size;

    if (end < length) {
      const size_t floor = start + chunk_size / 2;
      size_t boundary = boundary_after(code_points, U'.', start, end, floor);
      if (boundary == std::u32string::npos) {
        boundary = boundary_after(code_points, U'\n', start, end, floor);
      }
      if (boundary != std::u32string::npos) {
        end = boundary;
      }
    }

    const size_t stop = std::min(end, length);
    std::string chunk = text::trim(
        text::from_code_points(std::u32string_view(code_points).substr(start, stop - start)));
    if (text::code_point_length(chunk) > MIN_CHUNK_LENGTH) {
      chunks.push_back(std::move(chunk));
    }

    size_t next = end > overlap ? end - overlap : 0;
    if (next <= start) {
      next = end;
    }
    start = next;
  }

  return chunks;
}

}  // namespace docmind_core
