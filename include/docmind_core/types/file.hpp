#pragma once

#include <string>

namespace docmind_core {

// Document file type tag, derived from the upload's extension
enum class FileType { Text, Markdown, CSV, PDF, DOCX, XLSX, Unknown };

// Conversion utilities
std::string to_string(FileType type);
FileType file_type_from_string(const std::string& str);

// Maps a lower- or mixed-case extension (".txt", "CSV") to its file type
FileType file_type_from_extension(const std::string& extension);

}  // namespace docmind_core
