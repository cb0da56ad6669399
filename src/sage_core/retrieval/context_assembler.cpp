#include "sage_core/retrieval/context_assembler.hpp"

namespace sage_core {

std::string ContextAssembler::block_header(size_t position, const ChunkMetadata &metadata) {
  const std::string source = metadata.source.empty() ? "Unknown document" : metadata.source;
  const std::string page = metadata.page ? std::to_string(*metadata.page) : "N/A";
  return "[Source " + std::to_string(position) + ": " + source + ", Page " + page + "]";
}

std::string ContextAssembler::assemble(const std::vector<SearchResult> &results) {
  std::string context;
  for (size_t i = 0; i < results.size(); ++i) {
    if (i > 0) {
      context += SEPARATOR;
    }
    context += block_header(i + 1, results[i].metadata);
    context += "\n";
    context += results[i].content;
  }
  return context;
}

}  // namespace sage_core
