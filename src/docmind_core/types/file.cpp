#include "docmind_core/types/file.hpp"

#include <algorithm>
#include <cctype>

namespace docmind_core {

std::string to_string(FileType type) {
  switch (type) {
    case FileType::Text:
      return "Text";
    case FileType::Markdown:
      return "Markdown";
    case FileType::CSV:
      return "CSV";
    case FileType::PDF:
      return "PDF";
    case FileType::DOCX:
      return "DOCX";
    case FileType::XLSX:
      return "XLSX";
    default:
      return "Unknown";
  }
}

FileType file_type_from_string(const std::string& str) {
  if (str == "Text")
    return FileType::Text;
  if (str == "Markdown")
    return FileType::Markdown;
  if (str == "CSV")
    return FileType::CSV;
  if (str == "PDF")
    return FileType::PDF;
  if (str == "DOCX")
    return FileType::DOCX;
  if (str == "XLSX")
    return FileType::XLSX;
  return FileType::Unknown;
}

FileType file_type_from_extension(const std::string& extension) {
  std::string ext = extension;
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (!ext.empty() && ext.front() != '.') {
    ext.insert(ext.begin(), '.');
  }

  if (ext == ".txt")
    return FileType::Text;
  if (ext == ".md" || ext == ".markdown")
    return FileType::Markdown;
  if (ext == ".csv")
    return FileType::CSV;
  if (ext == ".pdf")
    return FileType::PDF;
  if (ext == ".docx")
    return FileType::DOCX;
  if (ext == ".xlsx" || ext == ".xls")
    return FileType::XLSX;
  return FileType::Unknown;
}

}  // namespace docmind_core
