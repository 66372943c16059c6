#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>

#include "server.hpp"

namespace docmind_core {
class DocumentIngestionService;
class DocumentInfoService;
class DocumentDeleteService;
class DocumentSummaryService;
class QueryService;
class ConversationStore;
class InMemoryMetricsSink;
}  // namespace docmind_core

namespace docmind_api {

// HTTP handlers. Every route except the health check requires an X-User-Id header.
class Routes {
 public:
  static constexpr int CONVERSATION_HISTORY_LIMIT = 20;

  Routes(std::shared_ptr<docmind_core::DocumentIngestionService> ingestion_service,
         std::shared_ptr<docmind_core::DocumentInfoService> info_service,
         std::shared_ptr<docmind_core::DocumentDeleteService> delete_service,
         std::shared_ptr<docmind_core::DocumentSummaryService> summary_service,
         std::shared_ptr<docmind_core::QueryService> query_service,
         std::shared_ptr<docmind_core::ConversationStore> conversation_store,
         std::shared_ptr<docmind_core::InMemoryMetricsSink> metrics_sink);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

 private:
  std::shared_ptr<docmind_core::DocumentIngestionService> ingestion_service_;
  std::shared_ptr<docmind_core::DocumentInfoService> info_service_;
  std::shared_ptr<docmind_core::DocumentDeleteService> delete_service_;
  std::shared_ptr<docmind_core::DocumentSummaryService> summary_service_;
  std::shared_ptr<docmind_core::QueryService> query_service_;
  std::shared_ptr<docmind_core::ConversationStore> conversation_store_;
  std::shared_ptr<docmind_core::InMemoryMetricsSink> metrics_sink_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_upload_document(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_get_document_content(const crow::request &req,
                                             const std::string &document_id);
  crow::response handle_delete_document(const crow::request &req, const std::string &document_id);
  crow::response handle_summarize_document(const crow::request &req,
                                           const std::string &document_id);
  crow::response handle_stats(const crow::request &req);
  crow::response handle_query(const crow::request &req);
  crow::response handle_get_conversation(const crow::request &req, const std::string &session_id);
  crow::response handle_clear_conversation(const crow::request &req,
                                           const std::string &session_id);
  crow::response handle_analytics(const crow::request &req);

  // Helper methods
  static std::optional<std::string> extract_owner(const crow::request &req);
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  crow::response unauthorized_response();
};

}  // namespace docmind_api
