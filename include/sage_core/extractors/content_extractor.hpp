#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "sage_core/types/file.hpp"

namespace fs = std::filesystem;

namespace sage_core {

struct ExtractionResult {
  std::string text;
  std::string content_hash;  // hex SHA-256 of the raw file bytes
  FileType file_type = FileType::Unknown;
  std::optional<std::string> title;
  std::int64_t file_size = 0;
};

class ContentExtractor {
 public:
  static constexpr std::uint64_t DEFAULT_MAX_FILE_SIZE_MB = 50;

  explicit ContentExtractor(std::uint64_t max_file_size_mb = DEFAULT_MAX_FILE_SIZE_MB)
      : max_file_size_bytes_(max_file_size_mb * 1024 * 1024) {}
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  virtual FileType get_file_type() const = 0;

  /**
   * @brief Reads and validates a file in one pass.
   * @throw ValidationError if the file is missing, not a regular file, larger
   *        than the configured limit, or contains no text.
   */
  ExtractionResult extract(const fs::path& file_path) const;

  std::string extract_text(const fs::path& file_path) const {
    return extract(file_path).text;
  }

  static std::string compute_hash_from_content(const std::string& content);

 protected:
  virtual std::optional<std::string> extract_title(const fs::path& file_path,
                                                   const std::string& content) const = 0;

  std::string get_string_content(const fs::path& file_path) const;

 private:
  std::uint64_t max_file_size_bytes_;
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace sage_core
