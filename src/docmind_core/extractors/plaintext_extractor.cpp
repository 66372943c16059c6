#include "docmind_core/extractors/plaintext_extractor.hpp"

#include <utf8.h>

#include <iterator>

namespace docmind_core {

std::vector<std::string> PlainTextExtractor::supported_extensions() const {
  return {".txt", ".md", ".markdown"};
}

FileType PlainTextExtractor::get_file_type(const fs::path& file_path) const {
  return file_type_from_extension(file_path.extension().string());
}

std::string PlainTextExtractor::extract_text(const fs::path& file_path) const {
  const std::string raw = read_file(file_path);
  if (utf8::is_valid(raw.begin(), raw.end())) {
    return raw;
  }
  // Legacy encodings are kept readable rather than rejected
  std::string repaired;
  repaired.reserve(raw.size());
  utf8::replace_invalid(raw.begin(), raw.end(), std::back_inserter(repaired));
  return repaired;
}

}  // namespace docmind_core
