#include "sage_core/extractors/plaintext_extractor.hpp"

#include <algorithm>
#include <cctype>

namespace sage_core {

bool PlainTextExtractor::can_handle(const fs::path& file_path) const {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return extension == ".txt";
}

std::optional<std::string> PlainTextExtractor::extract_title(const fs::path& file_path,
                                                             const std::string& /*content*/) const {
  const std::string stem = file_path.stem().string();
  if (stem.empty()) {
    return std::nullopt;
  }
  return stem;
}

}  // namespace sage_core
