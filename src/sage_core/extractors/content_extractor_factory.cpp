#include "sage_core/extractors/content_extractor_factory.hpp"

#include "sage_core/errors.hpp"
#include "sage_core/extractors/markdown_extractor.hpp"
#include "sage_core/extractors/plaintext_extractor.hpp"

namespace sage_core {

ContentExtractorFactory::ContentExtractorFactory(std::uint64_t max_file_size_mb) {
  extractors_.push_back(std::make_unique<MarkdownExtractor>(max_file_size_mb));
  extractors_.push_back(std::make_unique<PlainTextExtractor>(max_file_size_mb));
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors_) {
    if (extractor->can_handle(file_path)) {
      return *extractor;
    }
  }
  throw ValidationError("Unsupported file type: " + file_path.string() +
                        " (supported: .txt, .md, .markdown)");
}

bool ContentExtractorFactory::is_supported(const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors_) {
    if (extractor->can_handle(file_path)) {
      return true;
    }
  }
  return false;
}

}  // namespace sage_core
