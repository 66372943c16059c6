#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "text_extractor.hpp"

namespace docmind_core {

/**
 * @class TextExtractorRegistry
 * @brief Selects the TextExtractor for a file by its lower-cased extension.
 *
 * The default constructor registers the plain text/Markdown and CSV
 * extractors. This class is non-copyable and non-movable.
 */
class TextExtractorRegistry {
 public:
  TextExtractorRegistry();

  /**
   * @brief Adds an extractor; it takes over any extension already registered.
   */
  void register_extractor(TextExtractorPtr extractor);

  /**
   * @brief Returns the extractor registered for the file's extension.
   * @throw UnsupportedFormatError if no extractor handles the extension.
   */
  const TextExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  bool supports(const std::filesystem::path& file_path) const;

  TextExtractorRegistry(const TextExtractorRegistry&) = delete;
  TextExtractorRegistry& operator=(const TextExtractorRegistry&) = delete;
  TextExtractorRegistry(TextExtractorRegistry&&) = delete;
  TextExtractorRegistry& operator=(TextExtractorRegistry&&) = delete;

 private:
  static std::string normalized_extension(const std::filesystem::path& file_path);

  std::vector<TextExtractorPtr> extractors_;
  std::unordered_map<std::string, const TextExtractor*> by_extension_;
};

}  // namespace docmind_core
