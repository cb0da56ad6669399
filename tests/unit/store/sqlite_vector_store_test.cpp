#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "sage_core/db/pooled_connection.hpp"
#include "sage_core/services/compression_service.hpp"
#include "sage_core/store/sqlite_vector_store.hpp"

namespace sage_core {

using sage_tests::MockUtilities::create_angled_vector;
using sage_tests::MockUtilities::create_axis_vector;
using sage_tests::MockUtilities::create_test_metadata;

class SqliteVectorStoreTest : public sage_tests::VectorStoreTestBase {
 protected:
  // Stores one chunk per vector under ids doc_chunk_<i>
  void add_chunks(const std::string &collection, const std::vector<std::vector<float>> &vectors,
                  const std::string &prefix = "doc") {
    std::vector<std::string> ids;
    std::vector<std::string> documents;
    std::vector<ChunkMetadata> metadatas;
    for (size_t i = 0; i < vectors.size(); ++i) {
      ids.push_back(prefix + "_chunk_" + std::to_string(i));
      documents.push_back("text " + std::to_string(i) + " of " + prefix);
      metadatas.push_back(create_test_metadata(prefix + ".txt", 1, static_cast<int>(i)));
    }
    store_->upsert(collection, ids, vectors, documents, metadatas);
  }
};

TEST_F(SqliteVectorStoreTest, QueryingUnknownCollectionIsEmpty) {
  auto result = store_->query("nothing-here", create_axis_vector(0), 5);
  EXPECT_TRUE(result.empty());
}

TEST_F(SqliteVectorStoreTest, UpsertCreatesCollectionLazily) {
  EXPECT_TRUE(store_->list_collections().empty());

  add_chunks("docs", {create_axis_vector(0)});

  EXPECT_EQ(store_->list_collections(), std::vector<std::string>{"docs"});
  EXPECT_EQ(store_->stats("docs"), 1u);
}

TEST_F(SqliteVectorStoreTest, EnsureCollectionCreatesEmptyCollection) {
  store_->ensure_collection("empty");
  store_->ensure_collection("empty");

  EXPECT_EQ(store_->list_collections(), std::vector<std::string>{"empty"});
  EXPECT_EQ(store_->stats("empty"), 0u);
  EXPECT_TRUE(store_->query("empty", create_axis_vector(0), 3).empty());
}

TEST_F(SqliteVectorStoreTest, QueryReturnsNearestFirstWithCosineDistance) {
  add_chunks("docs", {create_angled_vector(60), create_angled_vector(0), create_angled_vector(90)});

  auto result = store_->query("docs", create_axis_vector(0), 3);

  ASSERT_EQ(result.size(), 3u);
  EXPECT_EQ(result.ids[0], "doc_chunk_1");
  EXPECT_EQ(result.ids[1], "doc_chunk_0");
  EXPECT_EQ(result.ids[2], "doc_chunk_2");
  EXPECT_NEAR(result.distances[0], 0.0, 1e-5);
  EXPECT_NEAR(result.distances[1], 0.5, 1e-5);
  EXPECT_NEAR(result.distances[2], 1.0, 1e-5);
  EXPECT_EQ(result.documents[0], "text 1 of doc");
  EXPECT_EQ(result.metadatas[0].chunk_index, 1);
  EXPECT_EQ(result.metadatas[0].source, "doc.txt");
}

TEST_F(SqliteVectorStoreTest, VectorsAreNormalizedBeforeIndexing) {
  std::vector<float> long_vector = create_axis_vector(0);
  long_vector[0] = 42.0f;
  add_chunks("docs", {long_vector});

  std::vector<float> query = create_axis_vector(0);
  query[0] = 0.25f;
  auto result = store_->query("docs", query, 1);

  ASSERT_EQ(result.size(), 1u);
  EXPECT_NEAR(result.distances[0], 0.0, 1e-5);
}

TEST_F(SqliteVectorStoreTest, TopKIsCappedAtCollectionSize) {
  add_chunks("docs", {create_axis_vector(0), create_axis_vector(1)});
  EXPECT_EQ(store_->query("docs", create_axis_vector(0), 50).size(), 2u);
  EXPECT_EQ(store_->query("docs", create_axis_vector(0), 1).size(), 1u);
}

TEST_F(SqliteVectorStoreTest, UpsertReplacesExistingIds) {
  add_chunks("docs", {create_axis_vector(0), create_axis_vector(1)});

  store_->upsert("docs", {"doc_chunk_0"}, {create_axis_vector(2)}, {"replaced"},
                 {create_test_metadata("new.txt")});

  EXPECT_EQ(store_->stats("docs"), 2u);
  auto result = store_->query("docs", create_axis_vector(2), 1);
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result.ids[0], "doc_chunk_0");
  EXPECT_EQ(result.documents[0], "replaced");
  EXPECT_EQ(result.metadatas[0].source, "new.txt");
}

TEST_F(SqliteVectorStoreTest, CollectionsAreIsolated) {
  add_chunks("alpha", {create_axis_vector(0)}, "a");
  add_chunks("beta", {create_axis_vector(0)}, "b");

  auto result = store_->query("alpha", create_axis_vector(0), 10);
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result.ids[0], "a_chunk_0");
  EXPECT_EQ(store_->list_collections(), (std::vector<std::string>{"alpha", "beta"}));
}

TEST_F(SqliteVectorStoreTest, SameChunkIdMayExistInTwoCollections) {
  add_chunks("alpha", {create_axis_vector(0)});
  add_chunks("beta", {create_axis_vector(1)});
  EXPECT_EQ(store_->stats("alpha"), 1u);
  EXPECT_EQ(store_->stats("beta"), 1u);
}

TEST_F(SqliteVectorStoreTest, RejectsDimensionMismatch) {
  add_chunks("docs", {create_axis_vector(0, 8)});

  EXPECT_THROW(add_chunks("docs", {create_axis_vector(0, 4)}, "other"), VectorStoreError);
  EXPECT_THROW(store_->query("docs", create_axis_vector(0, 4), 1), VectorStoreError);
  EXPECT_EQ(store_->stats("docs"), 1u);
}

TEST_F(SqliteVectorStoreTest, RejectsMalformedUpserts) {
  EXPECT_THROW(store_->upsert("docs", {"a", "b"}, {create_axis_vector(0)}, {"x"},
                              {create_test_metadata()}),
               VectorStoreError);
  EXPECT_THROW(store_->upsert("docs", {"a", "b"}, {create_axis_vector(0), create_axis_vector(0, 4)},
                              {"x", "y"}, {create_test_metadata(), create_test_metadata()}),
               VectorStoreError);
  EXPECT_THROW(store_->upsert("docs", {"a"}, {std::vector<float>{}}, {"x"}, {create_test_metadata()}),
               VectorStoreError);
  EXPECT_THROW(store_->upsert("docs", {"a"}, {create_axis_vector(0)}, {""}, {create_test_metadata()}),
               VectorStoreError);
  EXPECT_THROW(store_->upsert("bad name!", {"a"}, {create_axis_vector(0)}, {"x"},
                              {create_test_metadata()}),
               ValidationError);
  EXPECT_TRUE(store_->list_collections().empty());
}

TEST_F(SqliteVectorStoreTest, RemoveDeletesOnlyNamedChunks) {
  add_chunks("docs", {create_axis_vector(0), create_axis_vector(1), create_axis_vector(2)});

  EXPECT_EQ(store_->remove("docs", {"doc_chunk_0", "doc_chunk_2", "missing"}), 2u);

  EXPECT_EQ(store_->stats("docs"), 1u);
  auto result = store_->query("docs", create_axis_vector(0), 5);
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result.ids[0], "doc_chunk_1");
}

TEST_F(SqliteVectorStoreTest, RemoveFromUnknownCollectionRemovesNothing) {
  EXPECT_EQ(store_->remove("ghost", {"x"}), 0u);
  EXPECT_EQ(store_->remove("ghost", {}), 0u);
}

TEST_F(SqliteVectorStoreTest, DeleteCollectionCascadesToChunks) {
  add_chunks("docs", {create_axis_vector(0), create_axis_vector(1)});

  EXPECT_TRUE(store_->delete_collection("docs"));
  EXPECT_FALSE(store_->delete_collection("docs"));

  EXPECT_TRUE(store_->list_collections().empty());
  EXPECT_EQ(store_->stats("docs"), 0u);
  EXPECT_TRUE(store_->query("docs", create_axis_vector(0), 5).empty());

  sage_core::PooledConnection conn(*db_manager_);
  int remaining = -1;
  *conn << "SELECT COUNT(*) FROM chunks" >> remaining;
  EXPECT_EQ(remaining, 0);
}

TEST_F(SqliteVectorStoreTest, RecreatedCollectionAcceptsNewDimension) {
  add_chunks("docs", {create_axis_vector(0, 8)});
  ASSERT_TRUE(store_->delete_collection("docs"));

  EXPECT_NO_THROW(add_chunks("docs", {create_axis_vector(0, 4)}));
  EXPECT_EQ(store_->query("docs", create_axis_vector(0, 4), 1).size(), 1u);
}

TEST_F(SqliteVectorStoreTest, EntriesListEveryChunkInInsertionOrder) {
  add_chunks("docs", {create_axis_vector(0), create_axis_vector(1)}, "first");
  add_chunks("docs", {create_axis_vector(2)}, "second");

  auto entries = store_->entries("docs");
  EXPECT_EQ(entries.ids,
            (std::vector<std::string>{"first_chunk_0", "first_chunk_1", "second_chunk_0"}));
  ASSERT_EQ(entries.metadatas.size(), 3u);
  EXPECT_EQ(entries.metadatas[2].source, "second.txt");
  EXPECT_TRUE(store_->entries("ghost").ids.empty());
}

TEST_F(SqliteVectorStoreTest, ContentIsStoredCompressed) {
  add_chunks("docs", {create_axis_vector(0)});

  sage_core::PooledConnection conn(*db_manager_);
  std::vector<char> blob;
  *conn << "SELECT content FROM chunks LIMIT 1" >> blob;
  EXPECT_TRUE(CompressionService::is_compressed(blob));
  EXPECT_EQ(CompressionService::decompress(blob), "text 0 of doc");
}

TEST_F(SqliteVectorStoreTest, IndexSeesWritesMadeAfterFirstQuery) {
  add_chunks("docs", {create_axis_vector(0)}, "a");
  ASSERT_EQ(store_->query("docs", create_axis_vector(1), 5).size(), 1u);

  add_chunks("docs", {create_axis_vector(1)}, "b");
  auto result = store_->query("docs", create_axis_vector(1), 5);

  ASSERT_EQ(result.size(), 2u);
  EXPECT_EQ(result.ids[0], "b_chunk_0");
}

TEST_F(SqliteVectorStoreTest, ConcurrentReadsNeverCacheAStaleIndex) {
  constexpr int kWrites = 25;
  add_chunks("docs", {create_axis_vector(0)}, "seed");

  std::atomic<bool> done{false};
  std::thread reader([&] {
    while (!done.load()) {
      store_->query("docs", create_axis_vector(0), 100);
      store_->list_collections();
    }
  });

  for (int i = 0; i < kWrites; ++i) {
    add_chunks("docs", {create_axis_vector(i % 4)}, "w" + std::to_string(i));
    add_chunks("extra_" + std::to_string(i), {create_axis_vector(0)});
  }
  done = true;
  reader.join();

  EXPECT_EQ(store_->query("docs", create_axis_vector(0), 100).size(),
            static_cast<size_t>(kWrites + 1));
  EXPECT_EQ(store_->list_collections().size(), static_cast<size_t>(kWrites + 1));
}

TEST_F(SqliteVectorStoreTest, DataSurvivesANewStoreInstance) {
  add_chunks("docs", {create_axis_vector(3)});

  SqliteVectorStore reopened(*db_manager_);
  auto result = reopened.query("docs", create_axis_vector(3), 1);
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result.documents[0], "text 0 of doc");
}

TEST(CollectionNameTest, AcceptsLettersDigitsAndPunctuation) {
  EXPECT_NO_THROW(validate_collection_name("docs"));
  EXPECT_NO_THROW(validate_collection_name("team_notes-2024.v1"));
  EXPECT_NO_THROW(validate_collection_name(std::string(63, 'a')));
}

TEST(CollectionNameTest, RejectsEmptyLongOrOddNames) {
  EXPECT_THROW(validate_collection_name(""), ValidationError);
  EXPECT_THROW(validate_collection_name(std::string(64, 'a')), ValidationError);
  EXPECT_THROW(validate_collection_name("has space"), ValidationError);
  EXPECT_THROW(validate_collection_name("slash/name"), ValidationError);
  EXPECT_THROW(validate_collection_name("quote'name"), ValidationError);
}

}  // namespace sage_core
