#pragma once

#include "sage_core/extractors/content_extractor.hpp"

namespace sage_core {

class PlainTextExtractor : public ContentExtractor {
 public:
  using ContentExtractor::ContentExtractor;

  bool can_handle(const fs::path& file_path) const override;

  FileType get_file_type() const override {
    return FileType::Text;
  }

 protected:
  // The file name without its extension
  std::optional<std::string> extract_title(const fs::path& file_path,
                                           const std::string& content) const override;
};

}  // namespace sage_core
