#include <gtest/gtest.h>
#include "analysis/random_source.hpp"
#include "analysis/random_walk_ranker.hpp"
#include "graph/probability_model.hpp"

using namespace onto;

namespace {
const std::string kBook = "<http://schema.org/Book>";
const std::string kPerson = "<http://schema.org/Person>";
const std::string kPlace = "<http://schema.org/Place>";
const std::string kAuthor = "<http://schema.org/author>";
}

// Cycles through a fixed list of draws
class SequenceRandomSource : public RandomSource {
public:
    explicit SequenceRandomSource(std::vector<double> values) : values_(std::move(values)) {}

    double next_unit() override {
        double v = values_[pos_ % values_.size()];
        ++pos_;
        return v;
    }

private:
    std::vector<double> values_;
    size_t pos_ = 0;
};

// ==========================================
// Weighted Choice Tests
// ==========================================

TEST(WeightedChoiceTest, ProportionalBuckets) {
    std::vector<double> weights = {1.0, 0.0, 3.0};

    SequenceRandomSource low({0.1});
    EXPECT_EQ(weighted_choice(weights, low).value(), 0);

    SequenceRandomSource high({0.5});
    EXPECT_EQ(weighted_choice(weights, high).value(), 2);
}

TEST(WeightedChoiceTest, NoPositiveWeight) {
    SequenceRandomSource random({0.3});
    EXPECT_FALSE(weighted_choice({}, random).has_value());
    EXPECT_FALSE(weighted_choice({0.0, -1.0}, random).has_value());
}

TEST(WeightedChoiceTest, ZeroWeightNeverChosen) {
    SeededRandomSource random(7);
    std::vector<double> weights = {0.0, 2.0, 0.0, 1.0};
    for (int i = 0; i < 1000; ++i) {
        size_t pick = weighted_choice(weights, random).value();
        EXPECT_TRUE(pick == 1 || pick == 3);
    }
}

TEST(SeededRandomSourceTest, Reproducible) {
    SeededRandomSource a(123);
    SeededRandomSource b(123);
    for (int i = 0; i < 100; ++i) {
        double x = a.next_unit();
        EXPECT_EQ(x, b.next_unit());
        EXPECT_GE(x, 0.0);
        EXPECT_LT(x, 1.0);
    }
}

// ==========================================
// Random Walk Tests
// ==========================================

class RandomWalkTest : public ::testing::Test {
protected:
    ClassGraph graph;
    SeededRandomSource random{2024};
    RandomWalkRanker ranker;

    void SetUp() override {
        graph.add_edge(kBook, kAuthor, kPerson, 100);
        assign_edge_probabilities(graph);
    }
};

TEST_F(RandomWalkTest, SingleHopReachesPerson) {
    RankTables forward = ranker.rank(graph, WalkDirection::Forward, {{kBook, 100.0}}, random);

    // Every walk starts at Book and takes exactly one hop to Person
    EXPECT_NEAR(forward.rank_of(kPerson), 1.0, 0.02);
    EXPECT_NEAR(forward.rank_of(kBook), 1.0, 0.02);
    EXPECT_NEAR(forward.edge_rank_for(kBook).at(kAuthor), 1.0, 1e-9);
    EXPECT_TRUE(forward.edge_rank_for(kPerson).empty());
}

TEST_F(RandomWalkTest, BackwardWalkFollowsIncomingEdges) {
    RankTables backward = ranker.rank(graph, WalkDirection::Backward, {{kPerson, 80.0}}, random);

    EXPECT_NEAR(backward.rank_of(kBook), 1.0, 0.02);
    EXPECT_NEAR(backward.edge_rank_for(kPerson).at(kAuthor), 1.0, 1e-9);
}

TEST_F(RandomWalkTest, UnweightedClassesNeverStart) {
    RankTables forward = ranker.rank(graph, WalkDirection::Forward, {{kPerson, 10.0}, {kBook, 0.0}}, random);

    // Person has no outgoing edges, so walks end where they start
    EXPECT_NEAR(forward.rank_of(kPerson), 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(forward.rank_of(kBook), 0.0);
    EXPECT_TRUE(forward.edge_rank.empty());
}

TEST_F(RandomWalkTest, NoWeightsGiveZeroRanks) {
    RankTables forward = ranker.rank(graph, WalkDirection::Forward, {}, random);
    EXPECT_DOUBLE_EQ(forward.rank_of(kBook), 0.0);
    EXPECT_DOUBLE_EQ(forward.rank_of(kPerson), 0.0);
    EXPECT_EQ(forward.page_rank.size(), 2);
}

TEST_F(RandomWalkTest, LiteralSinkCreditsClassBeingLeft) {
    ClassGraph g;
    g.add_edge(kPlace, "<http://schema.org/name>", ClassGraph::kLiteralSink, 30);
    g.add_edge(kPlace, "<http://schema.org/containedIn>", kBook, 10);
    assign_edge_probabilities(g);

    RandomWalkRanker short_walks(RankerConfig{4000, 1});
    RankTables forward = short_walks.rank(g, WalkDirection::Forward, {{kPlace, 1.0}}, random);

    // 1 for the start plus 0.75 for the three walks in four that enter the sink
    EXPECT_NEAR(forward.rank_of(kPlace), 1.0 + 0.75 * 0.75, 0.03);
    EXPECT_NEAR(forward.rank_of(kBook), 0.25, 0.03);
    EXPECT_EQ(forward.page_rank.count(ClassGraph::kLiteralSink), 0);
}

TEST_F(RandomWalkTest, SameSeedSameRanks) {
    SeededRandomSource a(99);
    SeededRandomSource b(99);
    RankTables first = ranker.rank(graph, WalkDirection::Forward, {{kBook, 1.0}, {kPerson, 1.0}}, a);
    RankTables second = ranker.rank(graph, WalkDirection::Forward, {{kBook, 1.0}, {kPerson, 1.0}}, b);
    EXPECT_EQ(first.page_rank, second.page_rank);
    EXPECT_EQ(first.edge_rank, second.edge_rank);
}
