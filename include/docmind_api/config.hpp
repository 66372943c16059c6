#pragma once

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docmind_api {

class Config {
 public:
  std::string api_base_url;
  std::string metadata_db_path;
  // Name of the environment variable holding the database key
  std::string db_key_env;

  // Ollama
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;
  std::string completion_model;
  std::vector<std::string> fallback_models;
  double temperature;
  int max_tokens;
  int synthesis_timeout_seconds;

  // Ingestion and retrieval
  int chunk_size;
  int chunk_overlap;
  int num_workers;
  std::string embedding_failure_policy;
  double min_similarity;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }

    Config config;
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.metadata_db_path =
          json_config.value("metadata_db_path", std::string("./data/docmind.db"));
      config.db_key_env = json_config.value("db_key_env", std::string("DOCMIND_DB_KEY"));

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));
      config.embedding_dimension = json_config.value("embedding_dimension", 384);
      config.completion_model = json_config.value("completion_model", std::string("llama3.2"));
      config.fallback_models = json_config.value(
          "fallback_models", std::vector<std::string>{"llama3.1", "mistral", "codellama"});
      config.temperature = json_config.value("temperature", 0.7);
      config.max_tokens = json_config.value("max_tokens", 2000);
      config.synthesis_timeout_seconds = json_config.value("synthesis_timeout_seconds", 60);

      config.chunk_size = json_config.value("chunk_size", 500);
      config.chunk_overlap = json_config.value("chunk_overlap", 100);
      config.num_workers = json_config.value("num_workers", 4);
      config.embedding_failure_policy =
          json_config.value("embedding_failure_policy", std::string("zero_vector"));
      config.min_similarity = json_config.value("min_similarity", -1.0);
    } catch (const nlohmann::json::type_error& e) {
      throw std::runtime_error(std::string("Invalid config value type: ") + e.what());
    }

    config.validate();
    return config;
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    if (metadata_db_path.empty()) {
      throw std::runtime_error("metadata_db_path cannot be empty");
    }
    if (db_key_env.empty()) {
      throw std::runtime_error("db_key_env cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (completion_model.empty()) {
      throw std::runtime_error("completion_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (temperature < 0.0 || temperature > 2.0) {
      throw std::runtime_error("temperature must be between 0 and 2");
    }
    if (max_tokens <= 0) {
      throw std::runtime_error("max_tokens must be greater than 0");
    }
    if (synthesis_timeout_seconds <= 0) {
      throw std::runtime_error("synthesis_timeout_seconds must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be at least 0 and less than chunk_size");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (embedding_failure_policy != "zero_vector" && embedding_failure_policy != "abort") {
      throw std::runtime_error("embedding_failure_policy must be 'zero_vector' or 'abort'");
    }
    if (min_similarity < -1.0 || min_similarity >= 1.0) {
      throw std::runtime_error("min_similarity must be in [-1, 1)");
    }
  }
};

}  // namespace docmind_api
