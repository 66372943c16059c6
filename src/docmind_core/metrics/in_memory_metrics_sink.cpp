#include "docmind_core/metrics/in_memory_metrics_sink.hpp"

#include <algorithm>
#include <ctime>
#include <map>
#include <sstream>

#include "docmind_core/utils/text_utils.hpp"
#include "docmind_core/utils/time_utils.hpp"

namespace docmind_core {

std::string to_string(DocumentAction action) {
  switch (action) {
    case DocumentAction::Upload:
      return "upload";
    case DocumentAction::Query:
      return "query";
    case DocumentAction::View:
      return "view";
    case DocumentAction::Delete:
      return "delete";
  }
  return "unknown";
}

namespace {

int utc_hour(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct{};
  gmtime_r(&time_t, &tm_struct);
  return tm_struct.tm_hour;
}

bool is_stop_word(const std::string& word) {
  static const std::vector<std::string> stop_words = {"what", "how", "where", "when", "why",
                                                      "the",  "and", "or",    "but"};
  return std::find(stop_words.begin(), stop_words.end(), word) != stop_words.end();
}

// Sorts by descending count; ties keep first-seen order
std::vector<std::pair<std::string, size_t>> ranked(
    const std::vector<std::string>& first_seen, const std::unordered_map<std::string, size_t>& counts) {
  std::vector<std::pair<std::string, size_t>> out;
  out.reserve(first_seen.size());
  for (const auto& key : first_seen) {
    out.emplace_back(key, counts.at(key));
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const auto& a, const auto& b) { return a.second > b.second; });
  return out;
}

}  // namespace

void InMemoryMetricsSink::record_query(const QueryEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  queries_[event.owner_id].push_back(event);
}

void InMemoryMetricsSink::record_document_access(const std::string& owner_id,
                                                 const std::string& document_id,
                                                 DocumentAction action) {
  std::lock_guard<std::mutex> lock(mutex_);
  accesses_[owner_id].push_back({document_id, action, std::chrono::system_clock::now()});
}

UserAnalytics InMemoryMetricsSink::user_analytics(const std::string& owner_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  UserAnalytics analytics;

  static const std::vector<QueryEvent> no_queries;
  static const std::vector<AccessEvent> no_accesses;
  auto q_it = queries_.find(owner_id);
  auto a_it = accesses_.find(owner_id);
  const auto& queries = q_it != queries_.end() ? q_it->second : no_queries;
  const auto& accesses = a_it != accesses_.end() ? a_it->second : no_accesses;

  analytics.total_queries = queries.size();
  analytics.total_document_accesses = accesses.size();

  double total_time = 0.0;
  size_t timed = 0;
  std::vector<std::string> words_seen;
  std::unordered_map<std::string, size_t> word_counts;
  std::map<std::string, size_t> daily_counts;

  for (const auto& query : queries) {
    if (query.response_time_seconds > 0) {
      total_time += query.response_time_seconds;
      ++timed;
    }

    std::stringstream words(text::to_lower(query.query));
    std::string word;
    while (words >> word) {
      if (text::code_point_length(word) <= 3 || is_stop_word(word)) {
        continue;
      }
      if (word_counts[word]++ == 0) {
        words_seen.push_back(word);
      }
    }

    ++daily_counts[time_point_to_string(query.timestamp).substr(0, 10)];
    ++analytics.activity_by_hour[utc_hour(query.timestamp)];
  }
  analytics.average_response_time = timed > 0 ? total_time / static_cast<double>(timed) : 0.0;

  analytics.common_query_words = ranked(words_seen, word_counts);
  if (analytics.common_query_words.size() > COMMON_WORD_LIMIT) {
    analytics.common_query_words.resize(COMMON_WORD_LIMIT);
  }

  for (const auto& [date, count] : daily_counts) {
    analytics.query_trends.emplace_back(date, count);
  }
  if (analytics.query_trends.size() > TREND_DAYS) {
    analytics.query_trends.erase(analytics.query_trends.begin(),
                                 analytics.query_trends.end() - TREND_DAYS);
  }

  std::vector<std::string> documents_seen;
  std::unordered_map<std::string, size_t> document_counts;
  for (const auto& access : accesses) {
    if (document_counts[access.document_id]++ == 0) {
      documents_seen.push_back(access.document_id);
    }
    ++analytics.activity_by_hour[utc_hour(access.timestamp)];
  }
  analytics.document_usage = ranked(documents_seen, document_counts);

  return analytics;
}

}  // namespace docmind_core
