#include "docmind_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "docmind_core/db/conversation_store.hpp"
#include "docmind_core/metrics/in_memory_metrics_sink.hpp"
#include "docmind_core/services/document_delete_service.hpp"
#include "docmind_core/services/document_info_service.hpp"
#include "docmind_core/services/document_ingestion_service.hpp"
#include "docmind_core/services/document_summary_service.hpp"
#include "docmind_core/services/query_service.hpp"
#include "docmind_core/utils/time_utils.hpp"

namespace docmind_api {

namespace {

nlohmann::json summary_to_json(const docmind_core::DocumentSummary &summary) {
  nlohmann::json doc;
  doc["id"] = summary.id;
  doc["filename"] = summary.filename;
  doc["file_type"] = docmind_core::to_string(summary.file_type);
  doc["file_size"] = summary.file_size;
  doc["content_hash"] = summary.content_hash;
  doc["upload_date"] = docmind_core::time_point_to_iso8601(summary.uploaded_at);
  doc["chunk_count"] = summary.chunk_count;
  return doc;
}

nlohmann::json turn_to_json(const docmind_core::ConversationTurn &turn) {
  nlohmann::json json_turn;
  json_turn["role"] = docmind_core::to_string(turn.role);
  json_turn["content"] = turn.content;
  json_turn["timestamp"] = docmind_core::time_point_to_iso8601(turn.timestamp);
  if (turn.query_id) {
    json_turn["query_id"] = *turn.query_id;
  }
  return json_turn;
}

nlohmann::json query_response_to_json(const docmind_core::QueryResponse &response) {
  nlohmann::json result;
  result["answer"] = response.answer;
  result["confidence"] = response.confidence;
  result["query_id"] = response.query_id;
  result["timestamp"] = response.timestamp;
  result["status"] = docmind_core::to_string(response.status);
  result["conversation_updated"] = response.conversation_updated;
  if (response.document_searched) {
    result["document_searched"] = *response.document_searched;
  }

  nlohmann::json sources = nlohmann::json::array();
  for (const auto &source : response.sources) {
    nlohmann::json source_json;
    source_json["filename"] = source.filename;
    source_json["file_type"] = docmind_core::to_string(source.file_type);
    source_json["similarity_score"] = source.similarity_score;
    source_json["chunk_id"] = source.chunk_id;
    source_json["preview"] = source.preview;
    sources.push_back(source_json);
  }
  result["sources"] = sources;
  return result;
}

nlohmann::json pairs_to_json(const std::vector<std::pair<std::string, size_t>> &pairs,
                             const std::string &key_name) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto &[key, count] : pairs) {
    array.push_back({{key_name, key}, {"count", count}});
  }
  return array;
}

nlohmann::json analytics_to_json(const docmind_core::UserAnalytics &analytics) {
  nlohmann::json result;
  result["total_queries"] = analytics.total_queries;
  result["total_document_accesses"] = analytics.total_document_accesses;
  result["average_response_time"] = analytics.average_response_time;
  result["most_common_queries"] = pairs_to_json(analytics.common_query_words, "word");
  result["query_trends"] = pairs_to_json(analytics.query_trends, "date");
  result["document_usage"] = pairs_to_json(analytics.document_usage, "document_id");

  nlohmann::json by_hour = nlohmann::json::array();
  for (size_t hour = 0; hour < analytics.activity_by_hour.size(); ++hour) {
    by_hour.push_back({{"hour", hour}, {"count", analytics.activity_by_hour[hour]}});
  }
  result["activity_by_hour"] = by_hour;
  return result;
}

nlohmann::json summary_report_to_json(const docmind_core::DocumentSummaryReport &report) {
  nlohmann::json summary;
  summary["summary_id"] = report.summary_id;
  summary["document_id"] = report.document_id;
  summary["filename"] = report.filename;
  summary["file_type"] = docmind_core::to_string(report.file_type);
  summary["file_size"] = report.file_size;
  summary["upload_date"] = docmind_core::time_point_to_iso8601(report.uploaded_at);
  summary["summary_generated_at"] = docmind_core::time_point_to_iso8601(report.generated_at);
  summary["executive_summary"] = report.executive_summary;
  summary["model_generated"] = report.model_generated;
  summary["key_points"] = report.key_points;
  summary["quick_overview"] = report.quick_overview;

  const auto &stats = report.statistics;
  summary["statistics"] = {{"word_count", stats.word_count},
                           {"character_count", stats.character_count},
                           {"line_count", stats.line_count},
                           {"file_size_bytes", stats.file_size_bytes},
                           {"average_sentence_length", stats.average_sentence_length},
                           {"email_count", stats.email_count},
                           {"phone_count", stats.phone_count},
                           {"number_count", stats.number_count}};

  const auto &analysis = report.analysis;
  summary["content_analysis"] = {{"document_type", analysis.document_type},
                                 {"language", analysis.language},
                                 {"content_categories", analysis.content_categories},
                                 {"data_types", analysis.data_types}};
  return summary;
}

std::vector<docmind_core::ConversationTurn> parse_history(const nlohmann::json &history) {
  std::vector<docmind_core::ConversationTurn> turns;
  if (history.is_null()) {
    return turns;
  }
  if (!history.is_array()) {
    throw std::invalid_argument("conversation_history must be an array");
  }
  for (const auto &item : history) {
    docmind_core::ConversationTurn turn;
    turn.role = docmind_core::conversation_role_from_string(item.value("role", std::string("user")));
    turn.content = item.value("content", std::string());
    turn.timestamp = std::chrono::system_clock::now();
    turns.push_back(std::move(turn));
  }
  return turns;
}

}  // namespace

Routes::Routes(std::shared_ptr<docmind_core::DocumentIngestionService> ingestion_service,
               std::shared_ptr<docmind_core::DocumentInfoService> info_service,
               std::shared_ptr<docmind_core::DocumentDeleteService> delete_service,
               std::shared_ptr<docmind_core::DocumentSummaryService> summary_service,
               std::shared_ptr<docmind_core::QueryService> query_service,
               std::shared_ptr<docmind_core::ConversationStore> conversation_store,
               std::shared_ptr<docmind_core::InMemoryMetricsSink> metrics_sink)
    : ingestion_service_(std::move(ingestion_service)),
      info_service_(std::move(info_service)),
      delete_service_(std::move(delete_service)),
      summary_service_(std::move(summary_service)),
      query_service_(std::move(query_service)),
      conversation_store_(std::move(conversation_store)),
      metrics_sink_(std::move(metrics_sink)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoints
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/documents/upload")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_upload_document(req); });

  CROW_ROUTE(app, "/documents")
  ([this](const crow::request &req) { return handle_list_documents(req); });

  CROW_ROUTE(app, "/documents/<string>/content")
  ([this](const crow::request &req, const std::string &document_id) {
    return handle_get_document_content(req, document_id);
  });

  CROW_ROUTE(app, "/documents/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, const std::string &document_id) {
            return handle_delete_document(req, document_id);
          });

  CROW_ROUTE(app, "/documents/<string>/summarize")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req, const std::string &document_id) {
            return handle_summarize_document(req, document_id);
          });

  CROW_ROUTE(app, "/stats")
  ([this](const crow::request &req) { return handle_stats(req); });

  CROW_ROUTE(app, "/query").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_query(req);
  });

  CROW_ROUTE(app, "/conversation/<string>")
      .methods(crow::HTTPMethod::GET)(
          [this](const crow::request &req, const std::string &session_id) {
            return handle_get_conversation(req, session_id);
          });

  CROW_ROUTE(app, "/conversation/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, const std::string &session_id) {
            return handle_clear_conversation(req, session_id);
          });

  CROW_ROUTE(app, "/analytics")
  ([this](const crow::request &req) { return handle_analytics(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &) {
  nlohmann::json response = create_success_response("DocMind API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_upload_document(const crow::request &req) {
  auto owner = extract_owner(req);
  if (!owner) {
    return unauthorized_response();
  }
  try {
    nlohmann::json body = parse_json_body(req.body);
    if (!body.contains("file_path") || !body["file_path"].is_string()) {
      throw std::invalid_argument("Missing or invalid 'file_path' field");
    }

    docmind_core::IngestionRequest request;
    request.file_path = body["file_path"].get<std::string>();
    request.filename = body.value("filename", std::string());
    request.owner_id = *owner;
    std::cout << "Uploading document: " << request.file_path << std::endl;

    docmind_core::IngestionResult result = ingestion_service_->ingest(request);

    nlohmann::json data;
    data["document_id"] = result.document_id;
    data["chunk_count"] = result.chunk_count;
    data["duplicate"] = result.duplicate;
    return create_json_response(create_success_response(
        result.duplicate ? "Document already uploaded" : "Document processed successfully", data));
  } catch (const docmind_core::UnsupportedFormatError &e) {
    return create_json_response(create_error_response(e.what()), 415);
  } catch (const docmind_core::TextExtractorError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const docmind_core::EmbeddingUnavailableError &e) {
    std::cerr << "Exception in handle_upload_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 503);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_upload_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_list_documents(const crow::request &req) {
  auto owner = extract_owner(req);
  if (!owner) {
    return unauthorized_response();
  }
  try {
    nlohmann::json documents = nlohmann::json::array();
    for (const auto &summary : info_service_->list_documents(*owner)) {
      documents.push_back(summary_to_json(summary));
    }
    nlohmann::json response;
    response["documents"] = documents;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_list_documents: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_document_content(const crow::request &req,
                                                   const std::string &document_id) {
  auto owner = extract_owner(req);
  if (!owner) {
    return unauthorized_response();
  }
  try {
    docmind_core::DocumentSummary summary = info_service_->get_document(*owner, document_id);
    nlohmann::json response;
    response["document_id"] = document_id;
    response["filename"] = summary.filename;
    response["content"] = info_service_->get_content(*owner, document_id);
    return create_json_response(response);
  } catch (const docmind_core::DocumentNotFoundError &e) {
    return create_json_response(create_error_response(e.what()), 404);
  } catch (const docmind_core::DocumentAccessError &e) {
    return create_json_response(create_error_response(e.what()), 403);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_get_document_content: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_delete_document(const crow::request &req,
                                              const std::string &document_id) {
  auto owner = extract_owner(req);
  if (!owner) {
    return unauthorized_response();
  }
  try {
    delete_service_->delete_document(*owner, document_id);
    return create_json_response(create_success_response("Document deleted successfully"));
  } catch (const docmind_core::DocumentNotFoundError &e) {
    return create_json_response(create_error_response(e.what()), 404);
  } catch (const docmind_core::DocumentAccessError &e) {
    return create_json_response(create_error_response(e.what()), 403);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_delete_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_summarize_document(const crow::request &req,
                                                 const std::string &document_id) {
  auto owner = extract_owner(req);
  if (!owner) {
    return unauthorized_response();
  }
  try {
    docmind_core::DocumentSummaryReport report = summary_service_->summarize(*owner, document_id);
    nlohmann::json response;
    response["document_id"] = document_id;
    response["summary"] = summary_report_to_json(report);
    response["generated_at"] = docmind_core::time_point_to_iso8601(report.generated_at);
    response["status"] = "success";
    return create_json_response(response);
  } catch (const docmind_core::DocumentNotFoundError &e) {
    return create_json_response(create_error_response(e.what()), 404);
  } catch (const docmind_core::DocumentAccessError &e) {
    return create_json_response(create_error_response(e.what()), 403);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_summarize_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_stats(const crow::request &req) {
  auto owner = extract_owner(req);
  if (!owner) {
    return unauthorized_response();
  }
  try {
    docmind_core::CorpusStats stats = info_service_->corpus_stats();
    nlohmann::json response;
    response["total_documents"] = stats.total_documents;
    response["total_users"] = stats.total_owners;
    response["total_chunks"] = stats.total_chunks;
    response["recent_uploads"] = stats.recent_uploads;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_stats: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_query(const crow::request &req) {
  auto owner = extract_owner(req);
  if (!owner) {
    return unauthorized_response();
  }
  try {
    nlohmann::json body = parse_json_body(req.body);
    if (!body.contains("query") || !body["query"].is_string()) {
      throw std::invalid_argument("Missing or invalid 'query' field");
    }

    docmind_core::QueryRequest request;
    request.query = body["query"].get<std::string>();
    request.max_results = body.value("max_results", 5);
    request.owner_id = *owner;
    if (body.contains("document_id") && body["document_id"].is_string()) {
      request.document_id = body["document_id"].get<std::string>();
    }
    if (body.contains("session_id") && body["session_id"].is_string()) {
      request.session_id = body["session_id"].get<std::string>();
    }
    if (body.contains("conversation_history")) {
      request.conversation_history = parse_history(body["conversation_history"]);
    }
    std::cout << "Query received: '" << request.query << "'" << std::endl;

    return create_json_response(query_response_to_json(query_service_->answer(request)));
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const nlohmann::json::type_error &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_query: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_conversation(const crow::request &req,
                                               const std::string &session_id) {
  auto owner = extract_owner(req);
  if (!owner) {
    return unauthorized_response();
  }
  try {
    nlohmann::json history = nlohmann::json::array();
    for (const auto &turn :
         conversation_store_->history(*owner, session_id, CONVERSATION_HISTORY_LIMIT)) {
      history.push_back(turn_to_json(turn));
    }
    nlohmann::json response;
    response["conversation_history"] = history;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_get_conversation: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_clear_conversation(const crow::request &req,
                                                 const std::string &session_id) {
  auto owner = extract_owner(req);
  if (!owner) {
    return unauthorized_response();
  }
  try {
    int cleared = conversation_store_->clear(*owner, session_id);
    nlohmann::json data;
    data["cleared"] = cleared;
    return create_json_response(
        create_success_response("Conversation history cleared successfully", data));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_clear_conversation: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_analytics(const crow::request &req) {
  auto owner = extract_owner(req);
  if (!owner) {
    return unauthorized_response();
  }
  nlohmann::json response;
  response["analytics"] = analytics_to_json(metrics_sink_->user_analytics(*owner));
  return create_json_response(response);
}

std::optional<std::string> Routes::extract_owner(const crow::request &req) {
  std::string owner = req.get_header_value("X-User-Id");
  if (owner.empty()) {
    return std::nullopt;
  }
  return owner;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  try {
    return nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::invalid_argument(std::string("Invalid JSON body: ") + e.what());
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

crow::response Routes::unauthorized_response() {
  return create_json_response(create_error_response("Missing X-User-Id header"), 401);
}

}  // namespace docmind_api
