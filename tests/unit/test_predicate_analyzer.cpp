#include <gtest/gtest.h>
#include "analysis/predicate_analyzer.hpp"
#include "store/sparql_queries.hpp"
#include "scripted_store.hpp"

using namespace onto;
using namespace onto::testing_support;

namespace {
const std::string kBook = "<http://schema.org/Book>";
const std::string kAuthor = "<http://schema.org/author>";
const std::string kGenre = "<http://schema.org/genre>";
const std::string kIsbn = "<http://schema.org/isbn>";
}

class PredicateAnalyzerTest : public ::testing::Test {
protected:
    ScriptedStore store;
    MemoryCache cache;
    PredicateAnalyzerConfig config{"books", 2, false};

    void SetUp() override {
        store.script(sparql::class_instance_count(kBook), {row({{"count", num(100)}})});
        store.script(sparql::class_predicates(kBook), {
            row({{"p", iri(kAuthor)}}),
            row({{"p", iri(sparql::kTypePredicate)}}),
            row({{"p", iri(kGenre)}}),
            row({{"p", iri(kIsbn)}})
        });

        store.script(sparql::predicate_usage(kBook, kAuthor), {
            row({{"subjects", num(100)}, {"distinct", num(80)}, {"total", num(100)}})
        });
        store.script(sparql::predicate_value_groups(kBook, kAuthor), {
            row({{"count", num(50)}}), row({{"count", num(50)}})
        });
        store.script(sparql::predicate_subject_profiles(kBook, kAuthor), {
            row({{"predicates", num(2)}}), row({{"predicates", num(2)}})
        });

        store.script(sparql::predicate_usage(kBook, kGenre), {
            row({{"subjects", num(50)}, {"distinct", num(5)}, {"total", num(50)}})
        });
        QueryRows genre_groups;
        for (int i = 0; i < 5; ++i) genre_groups.push_back(row({{"count", num(10)}}));
        store.script(sparql::predicate_value_groups(kBook, kGenre), genre_groups);
        store.script(sparql::predicate_subject_profiles(kBook, kGenre), {
            row({{"predicates", num(3)}})
        });

        // Every book has its own ISBN
        store.script(sparql::predicate_usage(kBook, kIsbn), {
            row({{"subjects", num(100)}, {"distinct", num(100)}, {"total", num(100)}})
        });
    }
};

// ==========================================
// Statistics Tests
// ==========================================

TEST_F(PredicateAnalyzerTest, RawPredicateStatistics) {
    PredicateAnalyzer analyzer(store, cache, config);
    PredicateStats author = analyzer.predicate_stats(kBook, kAuthor, 100, 3);

    EXPECT_DOUBLE_EQ(author.frequency, 1.0);
    EXPECT_DOUBLE_EQ(author.uniqueness, 0.8);
    EXPECT_DOUBLE_EQ(author.entropy, 1.0);
    EXPECT_DOUBLE_EQ(author.quality, 3.0);
}

TEST_F(PredicateAnalyzerTest, IdentifierPredicatesAreDropped) {
    PredicateAnalyzer analyzer(store, cache, config);
    auto stats = analyzer.analyze(kBook, {});

    ASSERT_TRUE(stats.has_value());
    ASSERT_EQ(stats->size(), 2);
    EXPECT_EQ((*stats)[0].predicate, kAuthor);
    EXPECT_EQ((*stats)[1].predicate, kGenre);
    for (const auto& s : *stats) {
        EXPECT_NE(s.predicate, kIsbn);
        EXPECT_NE(s.predicate, sparql::kTypePredicate);
    }
}

TEST_F(PredicateAnalyzerTest, EntropyAndQualityAreScaled) {
    PredicateAnalyzer analyzer(store, cache, config);
    auto stats = analyzer.analyze(kBook, {});
    ASSERT_TRUE(stats.has_value());

    const auto& author = (*stats)[0];
    const auto& genre = (*stats)[1];

    // Five equal genres beat two equal authors
    EXPECT_DOUBLE_EQ(author.entropy, 0.0);
    EXPECT_DOUBLE_EQ(genre.entropy, 1.0);
    EXPECT_DOUBLE_EQ(author.quality, 1.0);
    EXPECT_DOUBLE_EQ(genre.quality, 0.0);

    // Unscaled
    EXPECT_DOUBLE_EQ(genre.frequency, 0.5);
    EXPECT_DOUBLE_EQ(genre.uniqueness, 0.1);
}

TEST_F(PredicateAnalyzerTest, EdgeRankAttached) {
    PredicateAnalyzer analyzer(store, cache, config);
    auto stats = analyzer.analyze(kBook, {{kAuthor, 0.75}});
    ASSERT_TRUE(stats.has_value());

    EXPECT_DOUBLE_EQ((*stats)[0].edge_rank, 0.75);
    EXPECT_DOUBLE_EQ((*stats)[1].edge_rank, 0.0);
}

TEST_F(PredicateAnalyzerTest, NoPredicatesIsEmptyAnalysis) {
    const std::string thing = "<http://schema.org/Thing>";
    PredicateAnalyzer analyzer(store, cache, config);

    EXPECT_FALSE(analyzer.analyze(thing, {}).has_value());
}

TEST_F(PredicateAnalyzerTest, OnlyIdentifiersIsEmptyAnalysis) {
    const std::string review = "<http://schema.org/Review>";
    store.script(sparql::class_instance_count(review), {row({{"count", num(10)}})});
    store.script(sparql::class_predicates(review), {row({{"p", iri(kIsbn)}})});
    store.script(sparql::predicate_usage(review, kIsbn), {
        row({{"subjects", num(10)}, {"distinct", num(10)}, {"total", num(10)}})
    });

    PredicateAnalyzer analyzer(store, cache, config);
    EXPECT_FALSE(analyzer.analyze(review, {}).has_value());
}

TEST_F(PredicateAnalyzerTest, QueryFailurePropagates) {
    store.fail_query(sparql::predicate_value_groups(kBook, kGenre));

    PredicateAnalyzer analyzer(store, cache, config);
    EXPECT_THROW(analyzer.analyze(kBook, {}), QueryFailed);
}

// ==========================================
// Cache Tests
// ==========================================

TEST_F(PredicateAnalyzerTest, CacheHitIssuesNoQueries) {
    PredicateAnalyzer analyzer(store, cache, config);
    auto first = analyzer.analyze(kBook, {{kAuthor, 0.5}});
    size_t queries = store.query_count();

    auto second = analyzer.analyze(kBook, {{kAuthor, 0.9}});
    EXPECT_EQ(store.query_count(), queries);

    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(second->size(), first->size());
    EXPECT_DOUBLE_EQ((*second)[0].uniqueness, (*first)[0].uniqueness);
    // Edge ranks follow the current call
    EXPECT_DOUBLE_EQ((*second)[0].edge_rank, 0.9);
}

TEST_F(PredicateAnalyzerTest, VersionChangeRecomputes) {
    PredicateAnalyzer analyzer(store, cache, config);
    analyzer.analyze(kBook, {});
    EXPECT_EQ(store.query_count(sparql::class_predicates(kBook)), 1);

    store.set_base_version(7);
    analyzer.analyze(kBook, {});
    EXPECT_EQ(store.query_count(sparql::class_predicates(kBook)), 2);

    auto entry = cache.get(predicate_cache_key("books", kBook));
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->version, 7);
}

TEST_F(PredicateAnalyzerTest, EmptyResultIsCached) {
    const std::string thing = "<http://schema.org/Thing>";
    PredicateAnalyzer analyzer(store, cache, config);
    analyzer.analyze(thing, {});
    size_t queries = store.query_count();

    EXPECT_FALSE(analyzer.analyze(thing, {}).has_value());
    EXPECT_EQ(store.query_count(), queries);
}

TEST_F(PredicateAnalyzerTest, CorruptCacheEntryRecomputes) {
    cache.put(predicate_cache_key("books", kBook), 0, "not json");

    PredicateAnalyzer analyzer(store, cache, config);
    auto stats = analyzer.analyze(kBook, {});
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->size(), 2);
    EXPECT_EQ(store.query_count(sparql::class_predicates(kBook)), 1);
}

TEST_F(PredicateAnalyzerTest, SingleWorkerMatchesParallel) {
    PredicateAnalyzer parallel(store, cache, config);
    auto a = parallel.analyze(kBook, {});

    MemoryCache other_cache;
    PredicateAnalyzer serial(store, other_cache, PredicateAnalyzerConfig{"books", 0, false});
    auto b = serial.analyze(kBook, {});

    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    ASSERT_EQ(a->size(), b->size());
    for (size_t i = 0; i < a->size(); ++i) {
        EXPECT_EQ((*a)[i].predicate, (*b)[i].predicate);
        EXPECT_DOUBLE_EQ((*a)[i].entropy, (*b)[i].entropy);
        EXPECT_DOUBLE_EQ((*a)[i].quality, (*b)[i].quality);
    }
}
