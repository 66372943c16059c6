#pragma once

#include <array>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "docmind_core/metrics/metrics_sink.hpp"

namespace docmind_core {

struct UserAnalytics {
  size_t total_queries = 0;
  size_t total_document_accesses = 0;
  // Mean over queries with a positive response time, 0 if there are none
  double average_response_time = 0.0;
  // (word, count), most frequent first, at most 5
  std::vector<std::pair<std::string, size_t>> common_query_words;
  // (YYYY-MM-DD, count) for the last 7 days with queries, oldest first
  std::vector<std::pair<std::string, size_t>> query_trends;
  // (document id, access count), most accessed first
  std::vector<std::pair<std::string, size_t>> document_usage;
  // Queries and accesses per UTC hour of day
  std::array<size_t, 24> activity_by_hour{};
};

/**
 * @class InMemoryMetricsSink
 * @brief Keeps every event in process memory, partitioned by owner.
 *
 * Nothing is persisted; a restart clears all analytics.
 */
class InMemoryMetricsSink : public MetricsSink {
 public:
  static constexpr size_t COMMON_WORD_LIMIT = 5;
  static constexpr size_t TREND_DAYS = 7;

  void record_query(const QueryEvent &event) override;
  void record_document_access(const std::string &owner_id, const std::string &document_id,
                              DocumentAction action) override;

  UserAnalytics user_analytics(const std::string &owner_id) const;

 private:
  struct AccessEvent {
    std::string document_id;
    DocumentAction action;
    std::chrono::system_clock::time_point timestamp;
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<QueryEvent>> queries_;
  std::unordered_map<std::string, std::vector<AccessEvent>> accesses_;
};

}  // namespace docmind_core
