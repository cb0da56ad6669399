#include "sage_core/extractors/content_extractor.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <sstream>

#include "sage_core/errors.hpp"

namespace sage_core {

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ValidationError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return buffer.str();
}

std::string ContentExtractor::compute_hash_from_content(const std::string& content) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(),
                                                                &EVP_MD_CTX_free);
  if (!mdctx) {
    throw SageError("Failed to create EVP context for hashing");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(mdctx.get(), content.data(), content.length()) != 1 ||
      EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
    throw SageError("Failed to compute SHA256 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

ExtractionResult ContentExtractor::extract(const fs::path& file_path) const {
  std::error_code ec;
  if (!fs::exists(file_path, ec)) {
    throw ValidationError("File not found: " + file_path.string());
  }
  if (!fs::is_regular_file(file_path, ec)) {
    throw ValidationError("Not a regular file: " + file_path.string());
  }
  if (!can_handle(file_path)) {
    throw ValidationError("Unsupported file type: " + file_path.string());
  }

  const auto size = fs::file_size(file_path, ec);
  if (ec) {
    throw ValidationError("Could not read size of " + file_path.string() + ": " + ec.message());
  }
  if (size > max_file_size_bytes_) {
    throw ValidationError("File too large: " + std::to_string(size) + " bytes (max: " +
                          std::to_string(max_file_size_bytes_) + ")");
  }

  ExtractionResult result;
  result.text = get_string_content(file_path);
  if (result.text.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw ValidationError("No text could be extracted from " + file_path.string());
  }
  result.content_hash = compute_hash_from_content(result.text);
  result.file_type = get_file_type();
  result.title = extract_title(file_path, result.text);
  result.file_size = static_cast<std::int64_t>(size);
  return result;
}

}  // namespace sage_core
