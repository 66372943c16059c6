#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docmind_core/db/conversation_store.hpp"
#include "docmind_core/metrics/metrics_sink.hpp"
#include "docmind_core/retrieval/context_assembler.hpp"
#include "docmind_core/retrieval/response_synthesizer.hpp"
#include "docmind_core/retrieval/retriever.hpp"

namespace docmind_core {

enum class QueryStatus { Answered, EmptyRetrieval, SynthesisUnavailable };

std::string to_string(QueryStatus status);

struct QueryRequest {
  std::string query;
  int max_results = 5;
  std::optional<std::string> document_id;
  std::string owner_id;
  // Used as prompt context when non-empty; otherwise the session's stored history is
  std::vector<ConversationTurn> conversation_history;
  std::optional<std::string> session_id;
};

struct SourceReference {
  std::string filename;
  FileType file_type = FileType::Unknown;
  float similarity_score = 0.0f;
  std::string chunk_id;
  // First 200 code points of the chunk, with "..." appended when cut
  std::string preview;
};

struct QueryResponse {
  std::string answer;
  std::vector<SourceReference> sources;
  float confidence = 0.0f;
  std::string query_id;
  std::string timestamp;
  // Filename of the best match, if anything matched
  std::optional<std::string> document_searched;
  bool conversation_updated = false;
  QueryStatus status = QueryStatus::Answered;
};

/**
 * @class QueryService
 * @brief The read path: retrieve, assemble, synthesize and score one question.
 *
 * Only the caller's own chunks are searched. Synthesis failures and empty
 * retrievals are reported through QueryResponse::status, never thrown.
 * The conversation store and metrics sink are optional.
 */
class QueryService {
 public:
  static const std::string NO_RELEVANT_INFORMATION_ANSWER;
  static constexpr size_t PREVIEW_LENGTH = 200;

  QueryService(std::shared_ptr<Retriever> retriever,
               std::shared_ptr<ResponseSynthesizer> synthesizer,
               std::shared_ptr<ConversationStore> conversation_store = nullptr,
               std::shared_ptr<MetricsSink> metrics_sink = nullptr);

  /**
   * @throw std::invalid_argument if max_results is not positive or the query is blank.
   * @throw DimensionMismatchError if the embedding provider and index disagree.
   */
  QueryResponse answer(const QueryRequest &request);

  static SourceReference make_source_reference(const SearchResult &result);

 private:
  std::vector<ConversationTurn> context_history(const QueryRequest &request);
  bool record_exchange(const QueryRequest &request, const QueryResponse &response);

  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<ResponseSynthesizer> synthesizer_;
  ContextAssembler assembler_;
  std::shared_ptr<ConversationStore> conversation_store_;
  std::shared_ptr<MetricsSink> metrics_sink_;
};

}  // namespace docmind_core
