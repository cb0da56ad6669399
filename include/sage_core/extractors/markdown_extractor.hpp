#pragma once

#include "sage_core/extractors/content_extractor.hpp"

namespace sage_core {

class MarkdownExtractor : public ContentExtractor {
 public:
  using ContentExtractor::ContentExtractor;

  bool can_handle(const fs::path& file_path) const override;

  FileType get_file_type() const override {
    return FileType::Markdown;
  }

 protected:
  // The first level-one heading, or the file name when there is none
  std::optional<std::string> extract_title(const fs::path& file_path,
                                           const std::string& content) const override;
};

}  // namespace sage_core
