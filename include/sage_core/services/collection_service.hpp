#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sage_core/store/vector_store.hpp"
#include "sage_core/types/search.hpp"

namespace sage_core {

// Read and delete operations over collections and the documents inside them
class CollectionService {
 public:
  explicit CollectionService(std::shared_ptr<VectorStore> store);

  std::vector<CollectionInfo> list_collections(bool include_documents = false);

  // Chunks grouped by document id, in order of first appearance
  std::vector<DocumentInfo> collection_documents(const std::string &name);

  // Returns the number of chunks removed
  size_t delete_documents(const std::string &collection,
                          const std::vector<std::string> &document_ids);

  void delete_collection(const std::string &name);

  bool collection_exists(const std::string &name);

 private:
  std::shared_ptr<VectorStore> store_;
};

}  // namespace sage_core
