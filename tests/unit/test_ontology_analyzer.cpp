#include <gtest/gtest.h>
#include "analysis/ontology_analyzer.hpp"
#include "store/sparql_queries.hpp"
#include "fixed_classifier.hpp"
#include "scripted_store.hpp"
#include <algorithm>

using namespace onto;
using namespace onto::testing_support;

namespace {
const std::string kBook = "<http://schema.org/Book>";
const std::string kPerson = "<http://schema.org/Person>";
const std::string kName = "<http://schema.org/name>";
const std::string kGenre = "<http://schema.org/genre>";
const std::string kIsbn = "<http://schema.org/isbn>";
}

/**
 * Books carry name, genre and isbn literals; people are not reachable
 * from books. name is informative, genre is constant and isbn is an
 * identifier.
 */
class OntologyAnalyzerTest : public ::testing::Test {
protected:
    ScriptedStore store;
    MemoryCache cache;
    FixedClassifier classifier{0.3};
    SeededRandomSource random{5};
    AnalyzerConfig config;

    void SetUp() override {
        config.dataset_name = "books";
        config.root_class = "Book";
        config.walk_count = 500;
        config.worker_threads = 2;

        store.script(sparql::distinct_classes(), {
            row({{"class", iri(kBook)}}),
            row({{"class", iri(kPerson)}})
        });
        store.script(sparql::class_relations(kBook), {
            row({{"p", iri(kName)}, {"count", num(100)}}),
            row({{"p", iri(kGenre)}, {"count", num(50)}})
        });
        store.script(sparql::class_relations(kPerson), {
            row({{"p", iri(kName)}, {"count", num(80)}})
        });

        store.script(sparql::class_instance_count(kBook), {row({{"count", num(100)}})});
        store.script(sparql::class_predicates(kBook), {
            row({{"p", iri(kName)}}),
            row({{"p", iri(kGenre)}}),
            row({{"p", iri(kIsbn)}})
        });

        store.script(sparql::predicate_usage(kBook, kName), {
            row({{"subjects", num(100)}, {"distinct", num(90)}, {"total", num(100)}})
        });
        store.script(sparql::predicate_value_groups(kBook, kName), {
            row({{"count", num(50)}}), row({{"count", num(50)}})
        });
        store.script(sparql::predicate_subject_profiles(kBook, kName), {
            row({{"predicates", num(3)}}), row({{"predicates", num(3)}})
        });

        store.script(sparql::predicate_usage(kBook, kGenre), {
            row({{"subjects", num(50)}, {"distinct", num(1)}, {"total", num(50)}})
        });
        store.script(sparql::predicate_value_groups(kBook, kGenre), {
            row({{"count", num(50)}})
        });
        store.script(sparql::predicate_subject_profiles(kBook, kGenre), {
            row({{"predicates", num(3)}})
        });

        store.script(sparql::predicate_usage(kBook, kIsbn), {
            row({{"subjects", num(100)}, {"distinct", num(100)}, {"total", num(100)}})
        });
    }
};

// ==========================================
// Structure Analysis Tests
// ==========================================

TEST_F(OntologyAnalyzerTest, RootResolvedAndKept) {
    OntologyAnalyzer analyzer(store, cache, classifier, random, config);
    StructureReport structure = analyzer.analyze_structure();

    EXPECT_EQ(structure.root, kBook);
    EXPECT_EQ(structure.graph.num_classes(), 2);
    ASSERT_EQ(structure.order.size(), 1);
    EXPECT_EQ(structure.order[0].class_iri, kBook);

    EXPECT_EQ(structure.keep_set, (std::set<std::string>{kBook}));
    EXPECT_EQ(structure.class_scores.count(kPerson), 0);
    EXPECT_GT(structure.final_forward.edge_rank_for(kBook).at(kName), 0.0);
}

TEST_F(OntologyAnalyzerTest, MissingRootIsGraphBuildError) {
    config.root_class = "Movie";
    OntologyAnalyzer analyzer(store, cache, classifier, random, config);

    try {
        analyzer.analyze_structure();
        FAIL() << "expected AnalysisError";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.phase(), AnalysisPhase::GraphBuild);
        EXPECT_NE(std::string(e.what()).find("<http://schema.org/Movie>"), std::string::npos);
    }
}

TEST_F(OntologyAnalyzerTest, StoreFailureDuringGraphBuild) {
    store.fail_query(sparql::class_relations(kPerson));
    OntologyAnalyzer analyzer(store, cache, classifier, random, config);

    try {
        analyzer.run();
        FAIL() << "expected AnalysisError";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.phase(), AnalysisPhase::GraphBuild);
        EXPECT_EQ(phase_name(e.phase()), "graph_build");
    }
}

// ==========================================
// Predicate Analysis Tests
// ==========================================

TEST_F(OntologyAnalyzerTest, RunScoresAndDecides) {
    OntologyAnalyzer analyzer(store, cache, classifier, random, config);
    AnalysisReport report = analyzer.run();

    ASSERT_EQ(report.classes.size(), 1);
    const ClassPredicateReport& book = report.classes[0];
    EXPECT_EQ(book.class_iri, kBook);
    ASSERT_TRUE(book.stats.has_value());
    ASSERT_EQ(book.stats->size(), 2);

    // name carries every positive signal; genre is constant
    EXPECT_EQ((*book.stats)[0].predicate, kName);
    EXPECT_NEAR((*book.stats)[0].score, 100.0, 1e-9);
    EXPECT_EQ((*book.stats)[1].score, 0.0);

    ASSERT_EQ(book.decisions.size(), 2);
    EXPECT_TRUE(book.decisions[0].keep);
    ASSERT_TRUE(book.decisions[0].hybrid.has_value());
    EXPECT_NEAR(book.decisions[0].hybrid.value(), 0.6, 1e-9);
    EXPECT_FALSE(book.decisions[1].keep);
    EXPECT_EQ(book.dropped_predicates(), (std::vector<std::string>{kGenre}));

    const AnalysisStatistics& stats = report.statistics;
    EXPECT_EQ(stats.total_classes, 2);
    EXPECT_EQ(stats.reachable_classes, 1);
    EXPECT_EQ(stats.kept_classes, 1);
    EXPECT_EQ(stats.classes_analyzed, 1);
    EXPECT_EQ(stats.predicates_scored, 2);
    EXPECT_EQ(stats.predicates_dropped, 1);
}

TEST_F(OntologyAnalyzerTest, ClassWithoutPredicatesHasNoAnalysis) {
    OntologyAnalyzer analyzer(store, cache, classifier, random, config);
    StructureReport structure = analyzer.analyze_structure();

    ClassPredicateReport person = analyzer.analyze_predicates(kPerson, structure);
    EXPECT_FALSE(person.stats.has_value());
    EXPECT_TRUE(person.decisions.empty());
    EXPECT_TRUE(person.dropped_predicates().empty());
    EXPECT_EQ(analyzer.get_statistics().classes_without_analysis, 1);
    EXPECT_TRUE(person.to_json()["stats"].is_null());
}

TEST_F(OntologyAnalyzerTest, StoreFailureDuringPredicateAnalysis) {
    store.fail_query(sparql::class_predicates(kBook));
    OntologyAnalyzer analyzer(store, cache, classifier, random, config);

    try {
        analyzer.run();
        FAIL() << "expected AnalysisError";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.phase(), AnalysisPhase::PredicateAnalysis);
    }
}

TEST_F(OntologyAnalyzerTest, ProgressReportedPerStage) {
    OntologyAnalyzer analyzer(store, cache, classifier, random, config);

    std::vector<std::string> stages;
    analyzer.set_progress_callback([&](const std::string& stage, int current, int total,
                                       const std::string&) {
        EXPECT_LE(current, total);
        if (stages.empty() || stages.back() != stage) {
            stages.push_back(stage);
        }
    });
    analyzer.run();

    EXPECT_EQ(stages, (std::vector<std::string>{"graph_build", "ranking", "predicate_analysis"}));
}

TEST_F(OntologyAnalyzerTest, ReportSerializes) {
    OntologyAnalyzer analyzer(store, cache, classifier, random, config);
    AnalysisReport report = analyzer.run();

    nlohmann::json j = report.to_json();
    EXPECT_EQ(j["structure"]["root"], kBook);
    EXPECT_EQ(j["classes"].size(), 1);
    EXPECT_EQ(j["statistics"]["kept_classes"], 1);
    EXPECT_EQ(j["classes"][0]["decisions"].size(), 2);
}

// ==========================================
// Mutation Tests
// ==========================================

TEST_F(OntologyAnalyzerTest, ApplyRemovesThenDropsThenResolves) {
    store.script(sparql::duplicate_type_pairs(), {
        row({{"a", iri(kBook)}, {"b", iri(kPerson)}})
    });
    store.script(sparql::duplicate_type_pairs(), {});

    OntologyAnalyzer analyzer(store, cache, classifier, random, config);
    AnalysisReport report = analyzer.run();
    MutationSummary summary = analyzer.apply(report);

    EXPECT_EQ(summary.removed_classes, (std::vector<std::string>{kPerson}));
    ASSERT_EQ(summary.dropped_predicates.count(kBook), 1);
    EXPECT_EQ(summary.dropped_predicates.at(kBook), (std::vector<std::string>{kGenre}));
    ASSERT_EQ(summary.demotions.size(), 1);
    EXPECT_EQ(summary.demotions[0].primary, kBook);

    auto updates = store.updates();
    ASSERT_EQ(updates.size(), 3);
    EXPECT_EQ(updates[0], sparql::remove_class(kPerson));
    EXPECT_EQ(updates[1], sparql::remove_predicate(kBook, kGenre));
    EXPECT_EQ(updates[2], sparql::demote_type(kBook, kPerson, config.additional_type_predicate));
}

TEST_F(OntologyAnalyzerTest, UpdateFailureIsMutationError) {
    store.fail_update_at(1);
    OntologyAnalyzer analyzer(store, cache, classifier, random, config);
    AnalysisReport report = analyzer.run();

    try {
        analyzer.apply(report);
        FAIL() << "expected AnalysisError";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.phase(), AnalysisPhase::Mutation);
    }
    // The class removal before the failure stays applied
    EXPECT_EQ(store.updates().size(), 1);
}

TEST_F(OntologyAnalyzerTest, MutationInvalidatesCachedResults) {
    OntologyAnalyzer analyzer(store, cache, classifier, random, config);
    AnalysisReport report = analyzer.run();
    size_t class_queries = store.query_count(sparql::distinct_classes());

    analyzer.run();
    EXPECT_EQ(store.query_count(sparql::distinct_classes()), class_queries);

    analyzer.apply(report);
    analyzer.run();
    EXPECT_EQ(store.query_count(sparql::distinct_classes()), class_queries + 1);
}
