#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace docmind_cli
{

  enum class Command
  {
    Upload,
    Query,
    List,
    Content,
    Delete,
    Summarize,
    Stats,
    History,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string filename;
    std::string query;
    std::string document_id;
    std::string session_id;
    int max_results = 5;
    bool clear = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    CliHandler(const std::string &api_base_url, const std::string &user_id);
    ~CliHandler();

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments; does not need a connection
    static CliOptions parse_arguments(int argc, char *argv[]);

    void execute_command(const CliOptions &options);

  private:
    std::string api_base_url_;
    std::string user_id_;
    CURL *curl_handle_;

    // Command handlers
    void handle_upload_command(const CliOptions &options);
    void handle_query_command(const CliOptions &options);
    void handle_list_command();
    void handle_content_command(const CliOptions &options);
    void handle_delete_command(const CliOptions &options);
    void handle_summarize_command(const CliOptions &options);
    void handle_stats_command();
    void handle_history_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json make_delete_request(const std::string &endpoint);
    nlohmann::json perform_request(const std::string &method, const std::string &endpoint,
                                   const std::string *body);

    // Helper methods
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_query_response(const nlohmann::json &response);
    void print_document_list(const nlohmann::json &response);
    void print_history(const nlohmann::json &response);
    void print_summary(const nlohmann::json &response);
    static void print_help();
    std::string build_url(const std::string &endpoint);
    std::string escape(const std::string &segment);
  };

}
