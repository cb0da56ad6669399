#include "sage_core/extractors/markdown_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace sage_core {

bool MarkdownExtractor::can_handle(const fs::path& file_path) const {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return extension == ".md" || extension == ".markdown";
}

std::optional<std::string> MarkdownExtractor::extract_title(const fs::path& file_path,
                                                            const std::string& content) const {
  const std::regex heading_regex(R"(^#[ \t]+([^\r\n]*[^\s#])[ \t#]*\r?$)",
                                 std::regex_constants::ECMAScript | std::regex_constants::multiline);
  std::smatch match;
  if (std::regex_search(content, match, heading_regex)) {
    return match[1].str();
  }

  const std::string stem = file_path.stem().string();
  if (stem.empty()) {
    return std::nullopt;
  }
  return stem;
}

}  // namespace sage_core
