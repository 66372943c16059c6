#pragma once

#include <chrono>
#include <string>

#include "docmind_core/types/file.hpp"

namespace docmind_core {

// Everything known about a document except its text
struct DocumentSummary {
  std::string id;
  std::string owner_id;
  std::string filename;
  FileType file_type = FileType::Unknown;
  size_t file_size = 0;
  std::string content_hash;
  std::chrono::system_clock::time_point uploaded_at;
  int chunk_count = 0;
};

struct Document : DocumentSummary {
  std::string content;
};

}  // namespace docmind_core
