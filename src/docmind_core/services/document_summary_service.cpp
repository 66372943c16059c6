#include "docmind_core/services/document_summary_service.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <iterator>
#include <regex>
#include <sstream>

#include "docmind_core/retrieval/context_assembler.hpp"
#include "docmind_core/utils/id_utils.hpp"
#include "docmind_core/utils/text_utils.hpp"

namespace docmind_core {

const std::string DocumentSummaryService::TOO_SHORT_SUMMARY =
    "Document is too short for a meaningful summary.";
const std::string DocumentSummaryService::NO_EXTRACTIVE_SUMMARY =
    "This document contains structured information that requires detailed review.";

namespace {

const std::regex EMAIL_PATTERN(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)");
const std::regex PHONE_PATTERN(R"(\b\d{10}\b)");
const std::regex YEAR_PATTERN(R"(\b\d{4}\b)");
const std::regex NUMBER_PATTERN(R"(\b\d+\.?\d*\b)");
const std::regex NAME_PATTERN(R"([A-Z][a-z]+\s+[A-Z][a-z]+)");
const std::regex DIGIT_PATTERN(R"(\d)");

bool is_spreadsheet(FileType file_type) {
  return file_type == FileType::CSV || file_type == FileType::XLSX;
}

bool contains_any(const std::string &lower_text, const std::vector<std::string> &keywords) {
  for (const auto &keyword : keywords) {
    if (lower_text.find(keyword) != std::string::npos) {
      return true;
    }
  }
  return false;
}

size_t count_matches(const std::string &text, const std::regex &pattern) {
  return static_cast<size_t>(
      std::distance(std::sregex_iterator(text.begin(), text.end(), pattern), std::sregex_iterator()));
}

size_t count_words(const std::string &text) {
  std::istringstream stream(text);
  std::string word;
  size_t count = 0;
  while (stream >> word) {
    ++count;
  }
  return count;
}

// Pieces between full stops, trimmed; empty pieces are kept so the count matches the stops
std::vector<std::string> split_sentences(const std::string &text) {
  std::vector<std::string> sentences;
  size_t start = 0;
  while (true) {
    size_t stop = text.find('.', start);
    sentences.push_back(text::trim(text.substr(start, stop - start)));
    if (stop == std::string::npos) {
      break;
    }
    start = stop + 1;
  }
  return sentences;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  return lines;
}

std::string collapse_whitespace(const std::string &text) {
  std::string collapsed;
  collapsed.reserve(text.size());
  bool in_space = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      in_space = true;
      continue;
    }
    if (in_space && !collapsed.empty()) {
      collapsed += ' ';
    }
    in_space = false;
    collapsed += c;
  }
  return collapsed;
}

std::string clip(const std::string &text, size_t max_code_points) {
  if (text::code_point_length(text) <= max_code_points) {
    return text;
  }
  return text::truncate(text, max_code_points) + "...";
}

std::vector<std::string> spreadsheet_key_points(const std::string &content) {
  std::vector<std::string> points;
  for (const auto &raw_line : split_lines(content)) {
    const std::string line = text::trim(raw_line);
    if (line.empty()) {
      continue;
    }
    const std::string lower = text::to_lower(line);
    if (std::regex_search(line, PHONE_PATTERN) && line.find('@') != std::string::npos) {
      points.push_back("Contact information found: " + clip(line, 100));
    }
    if (std::regex_search(line, DIGIT_PATTERN) &&
        contains_any(lower, {"score", "grade", "percent", "cpi", "gpa"})) {
      points.push_back("Academic data: " + clip(line, 100));
    }
    if (std::regex_search(line, NAME_PATTERN)) {
      points.push_back("Name entry: " + clip(line, 100));
    }
  }
  if (points.empty()) {
    points.push_back("Spreadsheet contains structured data with multiple entries.");
  }
  return points;
}

std::vector<std::string> general_key_points(const std::string &content) {
  std::vector<std::string> points;
  for (const auto &sentence : split_sentences(content)) {
    const size_t length = text::code_point_length(sentence);
    if (length >= 30 && length <= 200) {
      points.push_back(sentence);
      if (points.size() == DocumentSummaryService::MAX_GENERAL_KEY_POINTS) {
        break;
      }
    }
  }
  return points;
}

}  // namespace

DocumentSummaryService::DocumentSummaryService(
    std::shared_ptr<DocumentInfoService> info_service,
    std::shared_ptr<TextCompletionProvider> completion_provider, CompletionOptions options)
    : info_service_(std::move(info_service)),
      completion_provider_(std::move(completion_provider)),
      options_(std::move(options)) {}

CompletionOptions DocumentSummaryService::summary_options() {
  CompletionOptions options;
  options.temperature = 0.3;
  options.max_tokens = 150;
  return options;
}

DocumentSummaryReport DocumentSummaryService::summarize(const std::string &owner_id,
                                                        const std::string &document_id) {
  DocumentSummary document = info_service_->get_document(owner_id, document_id);
  const std::string content = info_service_->get_content(owner_id, document_id);
  std::cout << "Summarizing document: " << document.filename << std::endl;

  DocumentSummaryReport report;
  report.summary_id = generate_uuid_v4();
  report.document_id = document.id;
  report.filename = document.filename;
  report.file_type = document.file_type;
  report.file_size = document.file_size;
  report.uploaded_at = document.uploaded_at;
  report.generated_at = std::chrono::system_clock::now();

  const std::string clean = collapse_whitespace(content);
  if (text::code_point_length(clean) < MIN_SUMMARY_LENGTH) {
    report.executive_summary = TOO_SHORT_SUMMARY;
  } else {
    std::string generated = summarize_windows(clean);
    if (!generated.empty()) {
      report.executive_summary = std::move(generated);
      report.model_generated = true;
    } else {
      report.executive_summary = fallback_summary(content);
    }
  }

  report.key_points = key_points(content, document.file_type);
  report.statistics = statistics(content, document.file_size);
  report.analysis = analyze(content, document.file_type);
  report.quick_overview = quick_overview(content, document.file_type);
  return report;
}

std::string DocumentSummaryService::summarize_windows(const std::string &clean_content) const {
  const std::u32string code_points = text::to_code_points(clean_content);
  std::string joined;

  size_t windows = 0;
  for (size_t start = 0; start < code_points.size() && windows < MAX_SUMMARY_WINDOWS;
       start += SUMMARY_WINDOW - SUMMARY_WINDOW_OVERLAP, ++windows) {
    const std::string window = text::from_code_points(code_points.substr(start, SUMMARY_WINDOW));
    const std::string prompt =
        "Summarize the following text in 2-3 sentences:\n\n" + window + "\n\nSummary:";
    try {
      std::string summary = text::trim(completion_provider_->complete(prompt, options_));
      if (!summary.empty()) {
        joined += joined.empty() ? summary : " " + summary;
      }
    } catch (const CompletionError &e) {
      std::cerr << "DocumentSummaryService: window " << windows
                << " could not be summarized: " << e.what() << std::endl;
    } catch (const SynthesisUnavailableError &e) {
      std::cerr << "DocumentSummaryService: completion provider unavailable: " << e.what()
                << std::endl;
      break;
    }
    if (start + SUMMARY_WINDOW >= code_points.size()) {
      break;
    }
  }
  return joined;
}

std::string DocumentSummaryService::fallback_summary(const std::string &content) {
  std::vector<std::string> picked;
  for (const auto &sentence : split_sentences(content)) {
    const size_t length = text::code_point_length(sentence);
    if (length >= 20 && length <= 150) {
      picked.push_back(sentence);
      if (picked.size() == 3) {
        break;
      }
    }
  }
  if (picked.empty()) {
    return NO_EXTRACTIVE_SUMMARY;
  }
  std::string summary;
  for (const auto &sentence : picked) {
    summary += summary.empty() ? sentence : ". " + sentence;
  }
  return summary + ".";
}

std::vector<std::string> DocumentSummaryService::key_points(const std::string &content,
                                                            FileType file_type) {
  std::vector<std::string> points =
      is_spreadsheet(file_type) ? spreadsheet_key_points(content) : general_key_points(content);
  if (points.size() > MAX_KEY_POINTS) {
    points.resize(MAX_KEY_POINTS);
  }
  return points;
}

DocumentStatistics DocumentSummaryService::statistics(const std::string &content,
                                                      size_t file_size) {
  DocumentStatistics stats;
  stats.word_count = count_words(content);
  stats.character_count = text::code_point_length(content);
  stats.line_count = static_cast<size_t>(std::count(content.begin(), content.end(), '\n')) + 1;
  stats.file_size_bytes = file_size;

  const size_t sentence_count = split_sentences(content).size();
  stats.average_sentence_length =
      std::round(static_cast<double>(stats.word_count) / sentence_count * 100.0) / 100.0;

  stats.email_count = count_matches(content, EMAIL_PATTERN);
  stats.phone_count = count_matches(content, PHONE_PATTERN);
  stats.number_count = count_matches(content, NUMBER_PATTERN);
  return stats;
}

ContentAnalysis DocumentSummaryService::analyze(const std::string &content, FileType file_type) {
  const std::string lower = text::to_lower(content);
  ContentAnalysis analysis;

  if (is_spreadsheet(file_type)) {
    if (contains_any(lower, {"contact", "phone", "email", "student", "candidate"})) {
      analysis.document_type = "Contact/Student Database";
    } else if (contains_any(lower, {"financial", "revenue", "cost", "budget"})) {
      analysis.document_type = "Financial Data";
    } else {
      analysis.document_type = "Structured Data";
    }
  } else {
    analysis.document_type = "Text Document";
  }

  analysis.language = ContextAssembler::detect_language(content);

  if (contains_any(lower, {"contact", "phone", "email", "address"})) {
    analysis.content_categories.push_back("Contact Information");
  }
  if (contains_any(lower, {"academic", "student", "grade", "score", "cpi", "gpa"})) {
    analysis.content_categories.push_back("Academic Data");
  }
  if (contains_any(lower, {"financial", "revenue", "cost", "budget", "money"})) {
    analysis.content_categories.push_back("Financial Information");
  }
  if (contains_any(lower, {"technical", "code", "programming", "software"})) {
    analysis.content_categories.push_back("Technical Content");
  }
  if (contains_any(lower, {"legal", "agreement", "contract", "terms"})) {
    analysis.content_categories.push_back("Legal Content");
  }
  if (analysis.content_categories.empty()) {
    analysis.content_categories.push_back("General Content");
  }

  if (std::regex_search(content, EMAIL_PATTERN)) {
    analysis.data_types.push_back("Email Addresses");
  }
  if (std::regex_search(content, PHONE_PATTERN)) {
    analysis.data_types.push_back("Phone Numbers");
  }
  if (std::regex_search(content, YEAR_PATTERN)) {
    analysis.data_types.push_back("Years/Dates");
  }
  if (std::regex_search(content, NAME_PATTERN)) {
    analysis.data_types.push_back("Names");
  }
  if (std::regex_search(content, NUMBER_PATTERN)) {
    analysis.data_types.push_back("Numerical Data");
  }
  if (analysis.data_types.empty()) {
    analysis.data_types.push_back("Text Content");
  }
  return analysis;
}

std::string DocumentSummaryService::quick_overview(const std::string &content,
                                                   FileType file_type) {
  if (is_spreadsheet(file_type)) {
    size_t entries = 0;
    for (const auto &line : split_lines(content)) {
      if (!text::trim(line).empty()) {
        ++entries;
      }
    }
    return "This spreadsheet contains approximately " + std::to_string(entries) +
           " data entries with structured information.";
  }
  return "This document contains approximately " + std::to_string(count_words(content)) +
         " words of text content.";
}

}  // namespace docmind_core
