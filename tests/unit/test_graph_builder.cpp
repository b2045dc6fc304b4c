#include <gtest/gtest.h>
#include "graph/graph_builder.hpp"
#include "store/sparql_queries.hpp"
#include "scripted_store.hpp"

using namespace onto;
using namespace onto::testing_support;

namespace {
const std::string kBook = "<http://schema.org/Book>";
const std::string kPerson = "<http://schema.org/Person>";
const std::string kAuthor = "<http://schema.org/author>";
const std::string kName = "<http://schema.org/name>";
}

class GraphBuilderTest : public ::testing::Test {
protected:
    ScriptedStore store;
    MemoryCache cache;
    GraphBuilderConfig config{"books", false};

    void SetUp() override {
        store.script(sparql::distinct_classes(), {
            row({{"class", iri(kBook)}}),
            row({{"class", iri(kPerson)}}),
            row({{"class", iri(kBook)}}),
            row({{"class", RdfTerm::literal("not a class")}})
        });
        store.script(sparql::class_relations(kBook), {
            row({{"p", iri(kAuthor)}, {"otype", iri(kPerson)}, {"count", num(100)}}),
            row({{"p", iri(kName)}, {"count", num(100)}}),
            row({{"p", iri(sparql::kTypePredicate)}, {"otype", iri(kBook)}, {"count", num(100)}})
        });
        store.script(sparql::class_relations(kPerson), {
            row({{"p", iri(kName)}, {"count", num(80)}})
        });
    }
};

// ==========================================
// Query Tests
// ==========================================

TEST_F(GraphBuilderTest, QueriesClassesAndRelations) {
    GraphBuilder builder(store, cache, config);
    RelationSet relations = builder.query_relations();

    ASSERT_EQ(relations.classes.size(), 2);
    EXPECT_EQ(relations.classes[0], kBook);
    EXPECT_EQ(relations.classes[1], kPerson);

    // rdf:type is not a structural relation
    ASSERT_EQ(relations.relations.size(), 3);
    EXPECT_EQ(relations.relations[0].target, kPerson);
    EXPECT_EQ(relations.relations[1].target, ClassGraph::kLiteralSink);
    EXPECT_DOUBLE_EQ(relations.relations[2].count, 80.0);
}

TEST_F(GraphBuilderTest, BuildMaterializesGraph) {
    GraphBuilder builder(store, cache, config);
    ClassGraph graph = builder.build();

    EXPECT_EQ(graph.num_classes(), 2);
    EXPECT_EQ(graph.num_edges(), 3);
    auto sink = graph.literal_sink();
    EXPECT_EQ(graph.node(sink).incoming.size(), 2);
    EXPECT_TRUE(graph.node(sink).outgoing.empty());
}

// ==========================================
// Cache Tests
// ==========================================

TEST_F(GraphBuilderTest, SecondBuildUsesCache) {
    GraphBuilder builder(store, cache, config);
    builder.build();
    size_t queries = store.query_count();

    ClassGraph again = builder.build();
    EXPECT_EQ(store.query_count(), queries);
    EXPECT_EQ(again.num_edges(), 3);
}

TEST_F(GraphBuilderTest, VersionChangeInvalidatesCache) {
    GraphBuilder builder(store, cache, config);
    builder.build();

    store.write_history("Removing class <http://schema.org/Thing>");
    builder.build();
    EXPECT_EQ(store.query_count(sparql::distinct_classes()), 2);

    auto entry = cache.get(relations_cache_key("books"));
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->version, 1);
}

TEST_F(GraphBuilderTest, CorruptCacheIsRebuilt) {
    cache.put(relations_cache_key("books"), 0, "{\"classes\": 42}");

    GraphBuilder builder(store, cache, config);
    ClassGraph graph = builder.build();
    EXPECT_EQ(graph.num_classes(), 2);
    EXPECT_EQ(store.query_count(sparql::distinct_classes()), 1);
}

TEST_F(GraphBuilderTest, ClassQueryFailureIsFatal) {
    ScriptedStore failing;
    failing.fail_query(sparql::distinct_classes());

    GraphBuilder builder(failing, cache, config);
    EXPECT_THROW(builder.build(), QueryFailed);
}

TEST(RelationSetTest, JsonRoundTrip) {
    RelationSet set;
    set.classes = {kBook, kPerson};
    set.relations.push_back({kBook, kAuthor, kPerson, 100});
    set.relations.push_back({kBook, kName, ClassGraph::kLiteralSink, 100});

    RelationSet restored = RelationSet::from_json(set.to_json());
    ASSERT_EQ(restored.relations.size(), 2);
    EXPECT_EQ(restored.relations[1].target, ClassGraph::kLiteralSink);
    EXPECT_DOUBLE_EQ(restored.relations[0].count, 100.0);
}
