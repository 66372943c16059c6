#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace docmind_core {

enum class DocumentAction { Upload, Query, View, Delete };

std::string to_string(DocumentAction action);

struct QueryEvent {
  std::string owner_id;
  std::string query;
  std::optional<std::string> document_id;
  double response_time_seconds = 0.0;
  std::chrono::system_clock::time_point timestamp;
};

// Receives usage events from the serving layer. Implementations must be thread-safe.
class MetricsSink {
 public:
  virtual ~MetricsSink() = default;

  virtual void record_query(const QueryEvent &event) = 0;
  virtual void record_document_access(const std::string &owner_id, const std::string &document_id,
                                      DocumentAction action) = 0;
};

}  // namespace docmind_core
