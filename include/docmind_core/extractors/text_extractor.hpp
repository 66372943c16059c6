#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docmind_core/types/file.hpp"

namespace fs = std::filesystem;

namespace docmind_core {

// No extractor for the file, or the file yields no usable text
class UnsupportedFormatError : public std::exception {
 public:
  explicit UnsupportedFormatError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// I/O or hashing failure while extracting
class TextExtractorError : public std::exception {
 public:
  explicit TextExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct ExtractionResult {
  std::string text;
  std::string content_hash;
  FileType file_type;
};

class TextExtractor {
 public:
  virtual ~TextExtractor() = default;

  // Lower-case extensions including the dot, e.g. ".txt"
  virtual std::vector<std::string> supported_extensions() const = 0;

  virtual FileType get_file_type(const fs::path& file_path) const = 0;

  // Reads the file and renders it as plain UTF-8 text
  virtual std::string extract_text(const fs::path& file_path) const = 0;

  // Extracted text plus the SHA-256 of that text, in a single read
  ExtractionResult extract(const fs::path& file_path) const;

  static std::string compute_content_hash(const std::string& content);

 protected:
  std::string read_file(const fs::path& file_path) const;
};

using TextExtractorPtr = std::unique_ptr<TextExtractor>;

}  // namespace docmind_core
