#pragma once

#include <string>
#include <vector>

namespace docmind_core {

struct Chunk {
  std::string document_id;
  int chunk_index;
  std::string content;
  // Empty until the chunk has been embedded
  std::vector<float> vector_embedding;
};

// Chunk identifiers are "<document_id>_chunk_<index>"
inline std::string make_chunk_id(const std::string& document_id, int chunk_index) {
  return document_id + "_chunk_" + std::to_string(chunk_index);
}

}  // namespace docmind_core
