#include "docmind_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip>

namespace docmind_cli {

CliHandler::CliHandler(const std::string& api_base_url, const std::string& user_id)
    : api_base_url_(api_base_url), user_id_(user_id), curl_handle_(nullptr) {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "upload" || command == "u") {
        options.command = Command::Upload;
        for (int i = 2; i + 1 < argc; i += 2) {
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--file" || flag == "-f") {
                options.file_path = value;
            } else if (flag == "--name" || flag == "-n") {
                options.filename = value;
            }
        }
        if (options.file_path.empty()) {
            throw CliError("Upload command requires a file path. Usage: upload --file <path>");
        }
    } else if (command == "query" || command == "q") {
        options.command = Command::Query;
        for (int i = 2; i + 1 < argc; i += 2) {
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--query" || flag == "-q") {
                options.query = value;
            } else if (flag == "--max-results" || flag == "-k") {
                try {
                    options.max_results = std::stoi(value);
                } catch (const std::logic_error&) {
                    throw CliError("--max-results expects a number, got: " + value);
                }
            } else if (flag == "--document" || flag == "-d") {
                options.document_id = value;
            } else if (flag == "--session" || flag == "-s") {
                options.session_id = value;
            }
        }
        if (options.query.empty()) {
            throw CliError("Query command requires a question. Usage: query --query <question>");
        }
    } else if (command == "list" || command == "l") {
        options.command = Command::List;
    } else if (command == "stats") {
        options.command = Command::Stats;
    } else if (command == "content" || command == "c" || command == "delete" || command == "d" ||
               command == "summarize" || command == "s") {
        if (command == "content" || command == "c") {
            options.command = Command::Content;
        } else if (command == "delete" || command == "d") {
            options.command = Command::Delete;
        } else {
            options.command = Command::Summarize;
        }
        for (int i = 2; i + 1 < argc; i += 2) {
            std::string flag = argv[i];
            if (flag == "--id" || flag == "-i") {
                options.document_id = argv[i + 1];
            }
        }
        if (options.document_id.empty()) {
            throw CliError("Command '" + command + "' requires a document ID. Usage: " + command +
                           " --id <document_id>");
        }
    } else if (command == "history") {
        options.command = Command::History;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if ((flag == "--session" || flag == "-s") && i + 1 < argc) {
                options.session_id = argv[++i];
            } else if (flag == "--clear") {
                options.clear = true;
            }
        }
        if (options.session_id.empty()) {
            throw CliError("History command requires a session ID. Usage: history --session <id> [--clear]");
        }
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    if (options.command == Command::Help) {
        print_help();
        return;
    }
    if (user_id_.empty()) {
        throw CliError("DOCMIND_USER is not set");
    }

    switch (options.command) {
        case Command::Upload:
            handle_upload_command(options);
            break;
        case Command::Query:
            handle_query_command(options);
            break;
        case Command::List:
            handle_list_command();
            break;
        case Command::Content:
            handle_content_command(options);
            break;
        case Command::Delete:
            handle_delete_command(options);
            break;
        case Command::Summarize:
            handle_summarize_command(options);
            break;
        case Command::Stats:
            handle_stats_command();
            break;
        case Command::History:
            handle_history_command(options);
            break;
        case Command::Help:
            break;
    }
}

void CliHandler::handle_upload_command(const CliOptions& options) {
    std::cout << "Uploading file: " << options.file_path << std::endl;

    nlohmann::json request_data = {{"file_path", options.file_path}};
    if (!options.filename.empty()) {
        request_data["filename"] = options.filename;
    }

    nlohmann::json response = make_post_request("/documents/upload", request_data);
    const nlohmann::json data = response.value("data", nlohmann::json::object());
    std::cout << response.value("message", std::string()) << std::endl;
    std::cout << "  Document ID: " << data.value("document_id", std::string()) << std::endl;
    std::cout << "  Chunks:      " << data.value("chunk_count", 0) << std::endl;
}

void CliHandler::handle_query_command(const CliOptions& options) {
    nlohmann::json request_data = {
        {"query", options.query},
        {"max_results", options.max_results}
    };
    if (!options.document_id.empty()) {
        request_data["document_id"] = options.document_id;
    }
    if (!options.session_id.empty()) {
        request_data["session_id"] = options.session_id;
    }

    print_query_response(make_post_request("/query", request_data));
}

void CliHandler::handle_list_command() {
    print_document_list(make_get_request("/documents"));
}

void CliHandler::handle_content_command(const CliOptions& options) {
    nlohmann::json response = make_get_request("/documents/" + escape(options.document_id) + "/content");
    std::cout << "=== " << response.value("filename", std::string()) << " ===" << std::endl;
    std::cout << response.value("content", std::string()) << std::endl;
}

void CliHandler::handle_delete_command(const CliOptions& options) {
    nlohmann::json response = make_delete_request("/documents/" + escape(options.document_id));
    std::cout << response.value("message", std::string()) << std::endl;
}

void CliHandler::handle_summarize_command(const CliOptions& options) {
    std::cout << "Summarizing document " << options.document_id << "..." << std::endl;
    nlohmann::json empty_body = nlohmann::json::object();
    print_summary(make_post_request("/documents/" + escape(options.document_id) + "/summarize",
                                    empty_body));
}

void CliHandler::handle_stats_command() {
    nlohmann::json response = make_get_request("/stats");
    std::cout << "Documents:      " << response.value("total_documents", 0) << std::endl;
    std::cout << "Users:          " << response.value("total_users", 0) << std::endl;
    std::cout << "Chunks:         " << response.value("total_chunks", 0) << std::endl;
    std::cout << "Recent uploads: " << response.value("recent_uploads", 0) << std::endl;
}

void CliHandler::handle_history_command(const CliOptions& options) {
    const std::string endpoint = "/conversation/" + escape(options.session_id);
    if (options.clear) {
        nlohmann::json response = make_delete_request(endpoint);
        std::cout << response.value("message", std::string()) << std::endl;
        return;
    }
    print_history(make_get_request(endpoint));
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    return perform_request("GET", endpoint, nullptr);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    const std::string request_json = data.dump();
    return perform_request("POST", endpoint, &request_json);
}

nlohmann::json CliHandler::make_delete_request(const std::string& endpoint) {
    return perform_request("DELETE", endpoint, nullptr);
}

nlohmann::json CliHandler::perform_request(const std::string& method, const std::string& endpoint,
                                           const std::string* body) {
    std::string url = build_url(endpoint);
    std::string response_buffer;
    const std::string user_header = "X-User-Id: " + user_id_;

    curl_slist* headers = curl_slist_append(nullptr, user_header.c_str());
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
    }

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
    if (method == "POST") {
        curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, body ? body->c_str() : "");
    } else if (method != "GET") {
        curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    CURLcode res = curl_easy_perform(curl_handle_);
    curl_slist_free_all(headers);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(response_buffer);
    } catch (const nlohmann::json::parse_error&) {
        throw CliError("HTTP " + std::to_string(http_code) + ": unexpected response body");
    }
    if (http_code != 200) {
        throw CliError("HTTP " + std::to_string(http_code) + ": " +
                       response.value("error", std::string("request failed")));
    }
    return response;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    std::string url = api_base_url_;
    if (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + endpoint;
}

std::string CliHandler::escape(const std::string& segment) {
    char* escaped = curl_easy_escape(curl_handle_, segment.c_str(), static_cast<int>(segment.size()));
    if (!escaped) {
        throw CliError("Failed to URL-encode: " + segment);
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

void CliHandler::print_query_response(const nlohmann::json& response) {
    std::cout << "\n" << response.value("answer", std::string()) << "\n" << std::endl;
    std::cout << "Confidence: " << std::fixed << std::setprecision(2)
              << response.value("confidence", 0.0) << std::endl;

    if (response.contains("sources") && response["sources"].is_array() && !response["sources"].empty()) {
        std::cout << "\nSources:" << std::endl;
        int rank = 1;
        for (const auto& source : response["sources"]) {
            std::cout << "  " << rank++ << ". " << source.value("filename", std::string())
                      << " (" << std::setprecision(1) << source.value("similarity_score", 0.0) * 100.0
                      << "%)" << std::endl;
        }
    }
    if (response.value("conversation_updated", false)) {
        std::cout << "\n(conversation updated)" << std::endl;
    }
}

void CliHandler::print_document_list(const nlohmann::json& response) {
    const nlohmann::json documents = response.value("documents", nlohmann::json::array());
    if (!documents.is_array() || documents.empty()) {
        std::cout << "No documents uploaded." << std::endl;
        return;
    }
    std::cout << std::left << std::setw(38) << "ID" << std::setw(32) << "FILENAME" << std::setw(10)
              << "TYPE" << "CHUNKS" << std::endl;
    for (const auto& doc : documents) {
        std::cout << std::left << std::setw(38) << doc.value("id", std::string()) << std::setw(32)
                  << doc.value("filename", std::string()) << std::setw(10)
                  << doc.value("file_type", std::string()) << doc.value("chunk_count", 0) << std::endl;
    }
}

void CliHandler::print_history(const nlohmann::json& response) {
    const nlohmann::json history = response.value("conversation_history", nlohmann::json::array());
    if (!history.is_array() || history.empty()) {
        std::cout << "No conversation history." << std::endl;
        return;
    }
    for (const auto& turn : history) {
        std::cout << "[" << turn.value("timestamp", std::string()) << "] "
                  << turn.value("role", std::string()) << ": " << turn.value("content", std::string())
                  << "\n" << std::endl;
    }
}

void CliHandler::print_summary(const nlohmann::json& response) {
    const nlohmann::json summary = response.value("summary", nlohmann::json::object());
    std::cout << "=== " << summary.value("filename", std::string()) << " ===" << std::endl;
    std::cout << "\n" << summary.value("executive_summary", std::string()) << "\n" << std::endl;

    const nlohmann::json key_points = summary.value("key_points", nlohmann::json::array());
    if (key_points.is_array() && !key_points.empty()) {
        std::cout << "Key points:" << std::endl;
        for (const auto& point : key_points) {
            std::cout << "  - " << point.get<std::string>() << std::endl;
        }
        std::cout << std::endl;
    }

    const nlohmann::json analysis = summary.value("content_analysis", nlohmann::json::object());
    std::cout << "Type:     " << analysis.value("document_type", std::string()) << std::endl;
    std::cout << "Language: " << analysis.value("language", std::string()) << std::endl;
    std::cout << summary.value("quick_overview", std::string()) << std::endl;
}

void CliHandler::print_help() {
    std::cout << R"(
DocMind CLI - Question answering over your documents

Usage: docmind <command> [options]

Document Commands:
  upload, u     Upload a document for indexing (.txt, .md, .markdown, .csv)
    --file, -f <path>      Path to the file, as seen by the server
    --name, -n <name>      Display name (default: the file name)

  list, l       List your documents

  content, c    Print the full text of a document
    --id, -i <document_id>

  delete, d     Delete a document
    --id, -i <document_id>

  summarize, s  Summarize a document
    --id, -i <document_id>

  stats         Show document, user and chunk counts

Question Commands:
  query, q      Ask a question about your documents
    --query, -q <text>     The question
    --max-results, -k <n>  Number of chunks to retrieve (default: 5)
    --document, -d <id>    Only search this document
    --session, -s <id>     Use and extend this conversation

  history       Show a conversation
    --session, -s <id>     Conversation to show
    --clear                Delete the conversation instead

General:
  help, h       Show this help message

Environment Variables:
  DOCMIND_API_URL  Base URL for the DocMind API (default: http://127.0.0.1:3030)
  DOCMIND_USER     User ID sent with every request (required)

Examples:
  docmind upload --file /data/handbook.md
  docmind query --query "What is the vacation policy?" --session s1
  docmind history --session s1
)" << std::endl;
}

}  // namespace docmind_cli
