#pragma once

#include <string>
#include <vector>

#include "sage_core/types/search.hpp"

namespace sage_core {

// Formats ranked results into the context block handed to the generator
class ContextAssembler {
 public:
  static constexpr const char *SEPARATOR = "\n\n---\n\n";

  static std::string assemble(const std::vector<SearchResult> &results);

  // "[Source 2: guide.txt, Page 3]"
  static std::string block_header(size_t position, const ChunkMetadata &metadata);
};

}  // namespace sage_core
