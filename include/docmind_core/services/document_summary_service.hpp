#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "docmind_core/llm/completion_provider.hpp"
#include "docmind_core/services/document_info_service.hpp"

namespace docmind_core {

struct DocumentStatistics {
  size_t word_count = 0;
  size_t character_count = 0;
  size_t line_count = 0;
  size_t file_size_bytes = 0;
  double average_sentence_length = 0.0;
  size_t email_count = 0;
  size_t phone_count = 0;
  size_t number_count = 0;
};

struct ContentAnalysis {
  std::string document_type;
  std::string language;
  std::vector<std::string> content_categories;
  std::vector<std::string> data_types;
};

struct DocumentSummaryReport {
  std::string summary_id;
  std::string document_id;
  std::string filename;
  FileType file_type = FileType::Unknown;
  size_t file_size = 0;
  std::chrono::system_clock::time_point uploaded_at;
  std::chrono::system_clock::time_point generated_at;

  std::string executive_summary;
  // False when the executive summary is extractive or a fixed text
  bool model_generated = false;
  std::vector<std::string> key_points;
  DocumentStatistics statistics;
  ContentAnalysis analysis;
  std::string quick_overview;
};

/**
 * @class DocumentSummaryService
 * @brief Builds a summary report for one of the owner's documents.
 *
 * The executive summary asks the completion provider to summarize up to three
 * overlapping windows of the text. When no window yields a summary it falls
 * back to the first substantial sentences of the document. Key points,
 * statistics and the content analysis are computed locally from the text.
 */
class DocumentSummaryService {
 public:
  static constexpr size_t MIN_SUMMARY_LENGTH = 100;
  static constexpr size_t SUMMARY_WINDOW = 1000;
  static constexpr size_t SUMMARY_WINDOW_OVERLAP = 100;
  static constexpr size_t MAX_SUMMARY_WINDOWS = 3;
  static constexpr size_t MAX_KEY_POINTS = 10;
  static constexpr size_t MAX_GENERAL_KEY_POINTS = 8;

  static const std::string TOO_SHORT_SUMMARY;
  static const std::string NO_EXTRACTIVE_SUMMARY;

  DocumentSummaryService(std::shared_ptr<DocumentInfoService> info_service,
                         std::shared_ptr<TextCompletionProvider> completion_provider,
                         CompletionOptions options = summary_options());

  // Throws DocumentNotFoundError or DocumentAccessError
  DocumentSummaryReport summarize(const std::string &owner_id, const std::string &document_id);

  // Low temperature and a short answer
  static CompletionOptions summary_options();

  // Up to three sentences of 20 to 150 characters, or NO_EXTRACTIVE_SUMMARY
  static std::string fallback_summary(const std::string &content);

  static std::vector<std::string> key_points(const std::string &content, FileType file_type);
  static DocumentStatistics statistics(const std::string &content, size_t file_size);
  static ContentAnalysis analyze(const std::string &content, FileType file_type);
  static std::string quick_overview(const std::string &content, FileType file_type);

 private:
  // Empty when the provider produced nothing usable for any window
  std::string summarize_windows(const std::string &clean_content) const;

  std::shared_ptr<DocumentInfoService> info_service_;
  std::shared_ptr<TextCompletionProvider> completion_provider_;
  CompletionOptions options_;
};

}  // namespace docmind_core
