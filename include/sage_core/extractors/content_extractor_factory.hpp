#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include "sage_core/extractors/content_extractor.hpp"

namespace sage_core {

/**
 * @class ContentExtractorFactory
 * @brief Picks the ContentExtractor that handles a file, based on its extension.
 */
class ContentExtractorFactory {
 public:
  explicit ContentExtractorFactory(
      std::uint64_t max_file_size_mb = ContentExtractor::DEFAULT_MAX_FILE_SIZE_MB);

  /**
   * @brief Returns the first registered extractor that can handle the file.
   * @throw ValidationError if no extractor supports the file type.
   */
  const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  bool is_supported(const std::filesystem::path& file_path) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;

 private:
  std::vector<std::unique_ptr<ContentExtractor>> extractors_;
};

}  // namespace sage_core
