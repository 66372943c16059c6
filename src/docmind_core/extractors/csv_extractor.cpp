#include "docmind_core/extractors/csv_extractor.hpp"

#include <sstream>

#include "docmind_core/utils/text_utils.hpp"

namespace docmind_core {

std::vector<std::string> CsvExtractor::supported_extensions() const {
  return {".csv"};
}

FileType CsvExtractor::get_file_type(const fs::path& /*file_path*/) const {
  return FileType::CSV;
}

std::vector<std::vector<std::string>> CsvExtractor::parse_records(const std::string& csv) {
  std::vector<std::vector<std::string>> records;
  std::vector<std::string> record;
  std::string field;
  bool in_quotes = false;

  auto finish_record = [&]() {
    record.push_back(field);
    field.clear();
    bool all_empty = true;
    for (const auto& value : record) {
      if (!text::trim(value).empty()) {
        all_empty = false;
        break;
      }
    }
    if (!all_empty) {
      records.push_back(std::move(record));
    }
    record.clear();
  };

  for (size_t i = 0; i < csv.size(); ++i) {
    const char c = csv[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < csv.size() && csv[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    switch (c) {
      case '"':
        in_quotes = true;
        break;
      case ',':
        record.push_back(field);
        field.clear();
        break;
      case '\r':
        break;
      case '\n':
        finish_record();
        break;
      default:
        field.push_back(c);
    }
  }
  if (!field.empty() || !record.empty()) {
    finish_record();
  }

  return records;
}

std::string CsvExtractor::extract_text(const fs::path& file_path) const {
  const std::vector<std::vector<std::string>> records = parse_records(read_file(file_path));

  std::stringstream out;
  for (size_t r = 0; r < records.size(); ++r) {
    if (r > 0) {
      out << '\n';
    }
    for (size_t f = 0; f < records[r].size(); ++f) {
      if (f > 0) {
        out << " | ";
      }
      out << text::trim(records[r][f]);
    }
  }
  return out.str();
}

}  // namespace docmind_core
