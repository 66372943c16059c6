#include "docmind_core/extractors/text_extractor_registry.hpp"

#include <algorithm>
#include <cctype>

#include "docmind_core/extractors/csv_extractor.hpp"
#include "docmind_core/extractors/plaintext_extractor.hpp"

namespace docmind_core {

TextExtractorRegistry::TextExtractorRegistry() {
  register_extractor(std::make_unique<PlainTextExtractor>());
  register_extractor(std::make_unique<CsvExtractor>());
}

void TextExtractorRegistry::register_extractor(TextExtractorPtr extractor) {
  for (const auto& extension : extractor->supported_extensions()) {
    by_extension_[extension] = extractor.get();
  }
  extractors_.push_back(std::move(extractor));
}

std::string TextExtractorRegistry::normalized_extension(const std::filesystem::path& file_path) {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

const TextExtractor& TextExtractorRegistry::get_extractor_for(
    const std::filesystem::path& file_path) const {
  auto it = by_extension_.find(normalized_extension(file_path));
  if (it == by_extension_.end()) {
    throw UnsupportedFormatError("No text extractor registered for " + file_path.string());
  }
  return *it->second;
}

bool TextExtractorRegistry::supports(const std::filesystem::path& file_path) const {
  return by_extension_.count(normalized_extension(file_path)) > 0;
}

}  // namespace docmind_core
