#include <gtest/gtest.h>
#include "labshot/artifact_store.h"
#include "labshot/errors.h"
#include "file_utils.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

namespace labshot {
namespace {

class ArtifactStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = std::filesystem::temp_directory_path() /
               ("labshot_artifacts_" + FileUtils::random_hex(4));
        store = std::make_unique<ArtifactStore>(root.string());
    }

    void TearDown() override {
        store.reset();
        std::filesystem::remove_all(root);
    }

    std::filesystem::path root;
    std::unique_ptr<ArtifactStore> store;
};

TEST_F(ArtifactStoreTest, KeyLayout) {
    EXPECT_EQ(ArtifactStore::artifact_key("b-12", "q1", 0), "b-12/q1_0.png");
    EXPECT_EQ(ArtifactStore::artifact_key("b-12", "q1", 3, "md"), "b-12/q1_3.md");
}

TEST_F(ArtifactStoreTest, PutThenRead) {
    store->put("b-1/q1_0.png", "bytes");
    EXPECT_TRUE(store->exists("b-1/q1_0.png"));
    EXPECT_EQ(store->read("b-1/q1_0.png"), "bytes");
    EXPECT_TRUE(std::filesystem::exists(root / "b-1" / "q1_0.png"));
}

TEST_F(ArtifactStoreTest, WriteOnce) {
    // Given: A stored artifact
    store->put("b-1/q1_0.png", "first");

    // When/Then: A second write under the same key fails and keeps the original
    EXPECT_THROW(store->put("b-1/q1_0.png", "second"), StoreError);
    EXPECT_EQ(store->read("b-1/q1_0.png"), "first");
}

TEST_F(ArtifactStoreTest, RejectsEscapingKeys) {
    EXPECT_THROW(store->put("../outside.png", "x"), StoreError);
    EXPECT_THROW(store->put("b-1/../../x.png", "x"), StoreError);
    EXPECT_THROW(store->put("", "x"), StoreError);
    EXPECT_THROW(store->read("/etc/passwd"), StoreError);
}

TEST_F(ArtifactStoreTest, ReadMissingThrows) {
    EXPECT_FALSE(store->exists("b-1/none.png"));
    EXPECT_THROW(store->read("b-1/none.png"), StoreError);
}

TEST_F(ArtifactStoreTest, ContentAddressedIsIdempotent) {
    // Given: A document stored by content
    std::string key = store->put_content_addressed("b-1", "report", "md", "# Lab 1\n");

    // When: Storing identical content again
    std::string again = store->put_content_addressed("b-1", "report", "md", "# Lab 1\n");

    // Then: Same key, no error; different content gets a different key
    EXPECT_EQ(key, again);
    EXPECT_EQ(key, "b-1/report_" + FileUtils::sha256_string("# Lab 1\n").substr(0, 8) + ".md");
    EXPECT_NE(store->put_content_addressed("b-1", "report", "md", "# Lab 2\n"), key);
}

TEST_F(ArtifactStoreTest, ConcurrentWritersDistinctKeysNeverCollide) {
    // Given: Several threads writing task+index keys of their own
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (size_t i = 0; i < 10; ++i) {
                try {
                    store->put(ArtifactStore::artifact_key("b-1", "q" + std::to_string(t), i),
                               std::to_string(t) + ":" + std::to_string(i));
                } catch (const StoreError&) {
                    failures++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Then: Every write landed
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(store->read("b-1/q3_9.png"), "3:9");
}

} // namespace
} // namespace labshot
