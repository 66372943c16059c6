#include "docmind_core/services/query_service.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

#include "docmind_core/retrieval/confidence_scorer.hpp"
#include "docmind_core/utils/id_utils.hpp"
#include "docmind_core/utils/text_utils.hpp"
#include "docmind_core/utils/time_utils.hpp"

namespace docmind_core {

const std::string QueryService::NO_RELEVANT_INFORMATION_ANSWER =
    "I couldn't find any relevant information in the uploaded documents to answer your question. "
    "Please make sure you have uploaded the relevant documents and try asking a more specific "
    "question.";

std::string to_string(QueryStatus status) {
  switch (status) {
    case QueryStatus::Answered:
      return "answered";
    case QueryStatus::EmptyRetrieval:
      return "empty_retrieval";
    case QueryStatus::SynthesisUnavailable:
      return "synthesis_unavailable";
    default:
      return "unknown";
  }
}

QueryService::QueryService(std::shared_ptr<Retriever> retriever,
                           std::shared_ptr<ResponseSynthesizer> synthesizer,
                           std::shared_ptr<ConversationStore> conversation_store,
                           std::shared_ptr<MetricsSink> metrics_sink)
    : retriever_(std::move(retriever)),
      synthesizer_(std::move(synthesizer)),
      conversation_store_(std::move(conversation_store)),
      metrics_sink_(std::move(metrics_sink)) {}

SourceReference QueryService::make_source_reference(const SearchResult &result) {
  SourceReference source;
  source.filename = result.metadata.filename;
  source.file_type = result.metadata.file_type;
  source.similarity_score = result.similarity;
  source.chunk_id = result.chunk_id;
  if (text::code_point_length(result.content) > PREVIEW_LENGTH) {
    source.preview = text::truncate(result.content, PREVIEW_LENGTH) + "...";
  } else {
    source.preview = result.content;
  }
  return source;
}

QueryResponse QueryService::answer(const QueryRequest &request) {
  if (request.max_results <= 0) {
    throw std::invalid_argument("max_results must be positive");
  }
  if (text::trim(request.query).empty()) {
    throw std::invalid_argument("query must not be empty");
  }

  const auto started = std::chrono::steady_clock::now();

  QueryResponse response;
  response.query_id = generate_uuid_v4();
  response.timestamp = time_point_to_iso8601(std::chrono::system_clock::now());

  std::vector<SearchResult> results = retriever_->retrieve(
      request.query, request.max_results, request.document_id, request.owner_id);

  if (results.empty()) {
    response.answer = NO_RELEVANT_INFORMATION_ANSWER;
    response.confidence = 0.0f;
    response.status = QueryStatus::EmptyRetrieval;
  } else {
    const std::string prompt = assembler_.assemble(request.query, results, context_history(request));
    SynthesisResult synthesis = synthesizer_->synthesize(prompt, results);

    response.answer = synthesis.answer;
    if (synthesis.fallback_used) {
      response.confidence = 0.0f;
      response.status = QueryStatus::SynthesisUnavailable;
    } else {
      response.confidence = ConfidenceScorer::score(synthesis.answer);
      response.status = QueryStatus::Answered;
    }
    for (const auto &result : results) {
      response.sources.push_back(make_source_reference(result));
    }
    response.document_searched = results.front().metadata.filename;
  }

  response.conversation_updated = record_exchange(request, response);

  if (metrics_sink_) {
    QueryEvent event;
    event.owner_id = request.owner_id;
    event.query = request.query;
    event.document_id = request.document_id;
    event.response_time_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    event.timestamp = std::chrono::system_clock::now();
    metrics_sink_->record_query(event);
    if (request.document_id) {
      metrics_sink_->record_document_access(request.owner_id, *request.document_id,
                                            DocumentAction::Query);
    }
  }

  return response;
}

std::vector<ConversationTurn> QueryService::context_history(const QueryRequest &request) {
  if (!request.conversation_history.empty() || !request.session_id || !conversation_store_) {
    return request.conversation_history;
  }
  try {
    return conversation_store_->history(request.owner_id, *request.session_id);
  } catch (const DbError &e) {
    std::cerr << "QueryService: could not load conversation history: " << e.what() << std::endl;
    return {};
  }
}

bool QueryService::record_exchange(const QueryRequest &request, const QueryResponse &response) {
  if (!request.session_id || !conversation_store_) {
    return false;
  }

  const auto now = std::chrono::system_clock::now();
  ConversationTurn question{ConversationRole::User, request.query, now, response.query_id};
  ConversationTurn reply{ConversationRole::Assistant, response.answer, now, response.query_id};
  try {
    conversation_store_->append_exchange(request.owner_id, *request.session_id, question, reply);
  } catch (const DbError &e) {
    std::cerr << "QueryService: could not record conversation turn: " << e.what() << std::endl;
    return false;
  }
  return true;
}

}  // namespace docmind_core
