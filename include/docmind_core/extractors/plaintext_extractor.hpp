#pragma once

#include "text_extractor.hpp"

namespace docmind_core {

// Plain text and Markdown, passed through as-is
class PlainTextExtractor : public TextExtractor {
 public:
  std::vector<std::string> supported_extensions() const override;
  FileType get_file_type(const fs::path& file_path) const override;
  std::string extract_text(const fs::path& file_path) const override;
};

}  // namespace docmind_core
