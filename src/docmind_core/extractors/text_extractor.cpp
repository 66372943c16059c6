#include "docmind_core/extractors/text_extractor.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <sstream>

namespace docmind_core {

std::string TextExtractor::read_file(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw TextExtractorError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return buffer.str();
}

ExtractionResult TextExtractor::extract(const fs::path& file_path) const {
  ExtractionResult result;
  result.text = extract_text(file_path);
  result.content_hash = compute_content_hash(result.text);
  result.file_type = get_file_type(file_path);
  return result;
}

std::string TextExtractor::compute_content_hash(const std::string& content) {
  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw TextExtractorError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw TextExtractorError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw TextExtractorError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw TextExtractorError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }

  return ss.str();
}

}  // namespace docmind_core
