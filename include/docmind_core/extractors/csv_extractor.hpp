#pragma once

#include "text_extractor.hpp"

namespace docmind_core {

/**
 * @class CsvExtractor
 * @brief Renders a CSV file as text, one record per line with fields joined by " | ".
 *
 * Quoted fields may contain commas, doubled quotes and line breaks. Empty
 * records are skipped.
 */
class CsvExtractor : public TextExtractor {
 public:
  std::vector<std::string> supported_extensions() const override;
  FileType get_file_type(const fs::path& file_path) const override;
  std::string extract_text(const fs::path& file_path) const override;

  static std::vector<std::vector<std::string>> parse_records(const std::string& csv);
};

}  // namespace docmind_core
