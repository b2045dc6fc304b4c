#include <gtest/gtest.h>
#include "analysis/predicate_stats.hpp"
#include "cache/analysis_cache.hpp"
#include <filesystem>
#include <fstream>

using namespace onto;
using json = nlohmann::json;

class FileCacheTest : public ::testing::Test {
protected:
    std::string dir;

    void SetUp() override {
        dir = ::testing::TempDir() + "ontoscope_cache_test";
        std::filesystem::remove_all(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }
};

// ==========================================
// FileCache Tests
// ==========================================

TEST_F(FileCacheTest, MissingKeyIsMiss) {
    FileCache cache(dir);
    EXPECT_FALSE(cache.get("books/relations").has_value());
}

TEST_F(FileCacheTest, RoundTripKeepsVersionAndPayload) {
    FileCache cache(dir);

    PredicateStats s;
    s.predicate = "<http://schema.org/author>";
    s.frequency = 1.0;
    s.uniqueness = 0.8;
    s.entropy = 0.123456789012;
    s.quality = 0.75;
    cache.put("books/predicates/http__schema.org_Book", 5, stats_to_json({s}).dump());

    auto entry = cache.get("books/predicates/http__schema.org_Book");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->version, 5);

    auto restored = stats_from_json(json::parse(entry->bytes));
    ASSERT_EQ(restored.size(), 1);
    EXPECT_EQ(restored[0].predicate, s.predicate);
    EXPECT_NEAR(restored[0].frequency, 1.0, 1e-9);
    EXPECT_NEAR(restored[0].uniqueness, 0.8, 1e-9);
    EXPECT_NEAR(restored[0].entropy, 0.123456789012, 1e-9);
    EXPECT_NEAR(restored[0].quality, 0.75, 1e-9);
    EXPECT_FALSE(restored[0].score_ratio.has_value());
}

TEST_F(FileCacheTest, KeysMapToSubdirectories) {
    FileCache cache(dir);
    cache.put("books/relations", 1, "[]");
    EXPECT_TRUE(std::filesystem::exists(dir + "/books/relations.json"));
}

TEST_F(FileCacheTest, OverwriteReplacesVersion) {
    FileCache cache(dir);
    cache.put("books/relations", 1, "{\"a\":1}");
    cache.put("books/relations", 2, "{\"a\":2}");

    auto entry = cache.get("books/relations");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->version, 2);
    EXPECT_EQ(json::parse(entry->bytes)["a"], 2);
    EXPECT_FALSE(std::filesystem::exists(dir + "/books/relations.json.tmp"));
}

TEST_F(FileCacheTest, FailedWriteThrowsAndLeavesNoPartialFile) {
    FileCache cache(dir);
    // A directory where the entry file belongs cannot be replaced
    std::filesystem::create_directories(dir + "/books/relations.json/blocked");

    EXPECT_THROW(cache.put("books/relations", 1, "{\"a\":1}"), std::runtime_error);
    EXPECT_FALSE(std::filesystem::exists(dir + "/books/relations.json.tmp"));
    EXPECT_TRUE(std::filesystem::is_directory(dir + "/books/relations.json"));
}

TEST_F(FileCacheTest, UnparsableFileIsCorrupt) {
    FileCache cache(dir);
    std::filesystem::create_directories(dir + "/books");
    std::ofstream(dir + "/books/relations.json") << "[3, {\"classes\": [";

    EXPECT_THROW(cache.get("books/relations"), CacheCorrupt);
}

TEST_F(FileCacheTest, WrongShapeIsCorrupt) {
    FileCache cache(dir);
    std::filesystem::create_directories(dir + "/books");
    std::ofstream(dir + "/books/relations.json") << "{\"version\": 3}";

    EXPECT_THROW(cache.get("books/relations"), CacheCorrupt);
}

// ==========================================
// MemoryCache Tests
// ==========================================

TEST(MemoryCacheTest, PutAndGet) {
    MemoryCache cache;
    EXPECT_FALSE(cache.get("k").has_value());

    cache.put("k", 7, "payload");
    auto entry = cache.get("k");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->version, 7);
    EXPECT_EQ(entry->bytes, "payload");
    EXPECT_EQ(cache.size(), 1);
}

// ==========================================
// Cache Key Tests
// ==========================================

TEST(CacheKeyTest, SanitizesClassIri) {
    EXPECT_EQ(sanitize_class_iri("<http://schema.org/Book>"), "http__schema.org_Book");
    EXPECT_EQ(relations_cache_key("books"), "books/relations");
    EXPECT_EQ(predicate_cache_key("books", "<http://schema.org/Book>"),
              "books/predicates/http__schema.org_Book");
}
