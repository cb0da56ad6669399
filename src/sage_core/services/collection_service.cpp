#include "sage_core/services/collection_service.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "sage_core/errors.hpp"

namespace sage_core {

CollectionService::CollectionService(std::shared_ptr<VectorStore> store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("CollectionService requires a vector store");
  }
}

bool CollectionService::collection_exists(const std::string &name) {
  const auto names = store_->list_collections();
  return std::find(names.begin(), names.end(), name) != names.end();
}

std::vector<CollectionInfo> CollectionService::list_collections(bool include_documents) {
  std::vector<CollectionInfo> collections;
  for (const auto &name : store_->list_collections()) {
    CollectionInfo info;
    info.name = name;
    try {
      info.chunk_count = static_cast<int>(store_->stats(name));
      auto documents = collection_documents(name);
      info.document_count = static_cast<int>(documents.size());
      if (include_documents) {
        info.documents = std::move(documents);
      }
    } catch (const VectorStoreError &e) {
      // Still list the collection, with zero counts
      std::cerr << "Warning: Failed to get stats for collection " << name << ": " << e.what()
                << std::endl;
      info.chunk_count = 0;
      info.document_count = 0;
    }
    collections.push_back(std::move(info));
  }
  return collections;
}

std::vector<DocumentInfo> CollectionService::collection_documents(const std::string &name) {
  const StoredEntries entries = store_->entries(name);

  std::vector<DocumentInfo> documents;
  std::unordered_map<std::string, size_t> position;
  for (size_t i = 0; i < entries.ids.size(); ++i) {
    const std::string document_id = document_id_from_chunk_id(entries.ids[i]);
    const ChunkMetadata &metadata = entries.metadatas[i];

    auto it = position.find(document_id);
    if (it == position.end()) {
      DocumentInfo info;
      info.id = document_id;
      info.file_name = metadata.file_name.value_or(metadata.source.empty() ? "Unknown"
                                                                           : metadata.source);
      info.title = metadata.title;
      info.file_size = metadata.file_size;
      info.document_type = metadata.document_type;
      it = position.emplace(document_id, documents.size()).first;
      documents.push_back(std::move(info));
    }
    documents[it->second].chunk_count++;
  }
  return documents;
}

size_t CollectionService::delete_documents(const std::string &collection,
                                           const std::vector<std::string> &document_ids) {
  validate_collection_name(collection);
  if (!collection_exists(collection)) {
    throw NotFoundError("Collection " + collection + " does not exist");
  }
  if (document_ids.empty()) {
    return 0;
  }

  const std::unordered_set<std::string> targets(document_ids.begin(), document_ids.end());
  std::vector<std::string> chunk_ids;
  for (const auto &chunk_id : store_->entries(collection).ids) {
    if (targets.count(document_id_from_chunk_id(chunk_id)) > 0) {
      chunk_ids.push_back(chunk_id);
    }
  }
  if (chunk_ids.empty()) {
    return 0;
  }

  const size_t removed = store_->remove(collection, chunk_ids);
  std::cout << "Deleted " << removed << " chunks from " << document_ids.size() << " documents"
            << std::endl;
  return removed;
}

void CollectionService::delete_collection(const std::string &name) {
  validate_collection_name(name);
  if (!store_->delete_collection(name)) {
    throw NotFoundError("Collection " + name + " does not exist");
  }
  std::cout << "Deleted collection: " << name << std::endl;
}

}  // namespace sage_core
