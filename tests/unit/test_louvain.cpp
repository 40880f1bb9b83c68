#include <gtest/gtest.h>
#include "clustering/louvain.hpp"
#include <limits>
#include <tuple>

using namespace affinity;

namespace {

InterestGraph graph_from_edges(const std::set<std::string>& tags,
                               const std::vector<std::tuple<std::string, std::string, int>>& edges) {
    InterestGraph graph{InterestPool(tags)};
    for (const auto& [a, b, w] : edges) {
        for (int i = 0; i < w; ++i) graph.add_cooccurrence(a, b);
    }
    return graph;
}

// Two 3-cliques (weight 5) joined by a weak bridge c-d, plus an isolated tag g
InterestGraph two_cliques() {
    return graph_from_edges(
        {"a", "b", "c", "d", "e", "f", "g"},
        {
            {"a", "b", 5}, {"a", "c", 5}, {"b", "c", 5},
            {"d", "e", 5}, {"d", "f", 5}, {"e", "f", 5},
            {"c", "d", 1}
        });
}

// The A/B/C fixture: A-B weight 2, A-C and B-C weight 1
InterestGraph abc_fixture() {
    return graph_from_edges({"A", "B", "C"}, {{"A", "B", 2}, {"A", "C", 1}, {"B", "C", 1}});
}

void expect_complete(const InterestGraph& graph, const Partition& partition) {
    EXPECT_EQ(partition.size(), graph.num_nodes());
    for (const auto& tag : graph.nodes()) {
        auto it = partition.find(tag);
        ASSERT_NE(it, partition.end()) << tag << " is unassigned";
        EXPECT_GE(it->second, 0);
    }
}

}  // namespace

// ==========================================
// Fixtures with recorded partitions
// ==========================================

TEST(LouvainTest, AbcFixtureDefaultResolution) {
    auto graph = abc_fixture();
    ModularityClusterer clusterer;
    auto result = clusterer.cluster(graph);

    // The whole triangle beats {A,B},{C}: Q = 0 versus -0.125
    Partition expected = {{"A", 0}, {"B", 0}, {"C", 0}};
    EXPECT_EQ(result.partition, expected);
    EXPECT_NEAR(result.modularity, 0.0, 1e-12);
}

TEST(LouvainTest, AbcFixtureHighResolutionKeepsSingletons) {
    auto graph = abc_fixture();
    LouvainConfig config;
    config.resolution = 2.0;
    auto result = ModularityClusterer(config).cluster(graph);

    Partition expected = {{"A", 0}, {"B", 1}, {"C", 2}};
    EXPECT_EQ(result.partition, expected);
    EXPECT_EQ(result.levels, 1);
}

TEST(LouvainTest, TwoCliquesAndIsolatedNode) {
    auto graph = two_cliques();
    auto result = ModularityClusterer().cluster(graph);

    Partition expected = {
        {"a", 0}, {"b", 0}, {"c", 0},
        {"d", 1}, {"e", 1}, {"f", 1},
        {"g", 2}
    };
    EXPECT_EQ(result.partition, expected);
    EXPECT_EQ(result.num_clusters(), 3);
    EXPECT_GT(result.modularity, 0.4);
    EXPECT_GE(result.levels, 2);
}

// ==========================================
// Modularity
// ==========================================

TEST(ModularityTest, KnownValues) {
    auto graph = abc_fixture();

    EXPECT_NEAR(compute_modularity(graph, {{"A", 0}, {"B", 0}, {"C", 0}}), 0.0, 1e-12);
    EXPECT_NEAR(compute_modularity(graph, {{"A", 0}, {"B", 0}, {"C", 1}}), -0.125, 1e-12);

    // Singletons: -(3/8)^2 - (3/8)^2 - (2/8)^2
    EXPECT_NEAR(compute_modularity(graph, {{"A", 0}, {"B", 1}, {"C", 2}}), -0.34375, 1e-12);

    // Missing tags count as singletons
    EXPECT_NEAR(compute_modularity(graph, {{"A", 0}, {"B", 0}}), -0.125, 1e-12);
}

TEST(ModularityTest, ResolutionScalesNullModel) {
    auto graph = abc_fixture();
    Partition all = {{"A", 0}, {"B", 0}, {"C", 0}};
    EXPECT_NEAR(compute_modularity(graph, all, 2.0), -1.0, 1e-12);
}

TEST(ModularityTest, EmptyGraphIsZero) {
    InterestGraph graph{InterestPool(std::set<std::string>{"x", "y"})};
    EXPECT_EQ(compute_modularity(graph, {{"x", 0}, {"y", 1}}), 0.0);
}

TEST(ModularityTest, MonotoneAcrossPassesAndLevels) {
    auto graph = two_cliques();
    auto result = ModularityClusterer().cluster(graph);

    ASSERT_FALSE(result.pass_modularity.empty());
    double previous = result.pass_modularity.front().front();
    for (const auto& level : result.pass_modularity) {
        // Aggregation preserves modularity, so each level starts where the last ended
        EXPECT_NEAR(level.front(), previous, 1e-9);
        for (double q : level) {
            EXPECT_GE(q + 1e-12, previous);
            previous = q;
        }
    }
    EXPECT_NEAR(previous, result.modularity, 1e-9);
}

// ==========================================
// Aggregation
// ==========================================

TEST(LevelGraphTest, AggregatePreservesWeightAndDegrees) {
    auto level = LevelGraph::from_interest_graph(two_cliques());
    EXPECT_DOUBLE_EQ(level.total_weight(), 31.0);

    std::vector<int> community = {0, 0, 0, 1, 1, 1, 2};
    auto next = level.aggregate(community, 3);

    ASSERT_EQ(next.size(), 3);
    EXPECT_DOUBLE_EQ(next.total_weight(), 31.0);
    EXPECT_DOUBLE_EQ(next.self_loops[0], 15.0);
    EXPECT_DOUBLE_EQ(next.self_loops[1], 15.0);
    EXPECT_DOUBLE_EQ(next.self_loops[2], 0.0);
    EXPECT_DOUBLE_EQ(next.adj[0].at(1), 1.0);
    EXPECT_DOUBLE_EQ(next.adj[1].at(0), 1.0);
    EXPECT_TRUE(next.adj[2].empty());

    // Degree of a cluster node = sum of member degrees
    EXPECT_DOUBLE_EQ(next.degree(0), level.degree(0) + level.degree(1) + level.degree(2));

    // Same modularity before and after aggregation
    EXPECT_NEAR(compute_modularity(level, community), compute_modularity(next, {0, 1, 2}), 1e-12);
}

TEST(LevelGraphTest, LocalMovingStopsOnZeroMovePass) {
    auto level = LevelGraph::from_interest_graph(two_cliques());
    ModularityClusterer clusterer;

    std::vector<int> community;
    std::vector<double> trace;
    size_t moves = clusterer.move_nodes(level, community, trace, nullptr);

    EXPECT_GT(moves, 0);
    ASSERT_GE(trace.size(), 3);  // initial + at least one moving pass + the final quiet pass
    EXPECT_EQ(community[0], community[1]);
    EXPECT_EQ(community[1], community[2]);
    EXPECT_EQ(community[3], community[4]);
    EXPECT_EQ(community[4], community[5]);
    EXPECT_NE(community[0], community[3]);
}

// ==========================================
// Determinism and seeding
// ==========================================

TEST(LouvainDeterminismTest, SameInputSamePartition) {
    auto graph = two_cliques();
    auto first = ModularityClusterer().cluster(graph);
    auto second = ModularityClusterer().cluster(graph);
    EXPECT_EQ(first.partition, second.partition);
    EXPECT_EQ(first.pass_modularity, second.pass_modularity);
}

TEST(LouvainDeterminismTest, SameSeedSamePartition) {
    auto graph = two_cliques();
    LouvainConfig config;
    config.seed = 42;

    auto first = ModularityClusterer(config).cluster(graph);
    auto second = ModularityClusterer(config).cluster(graph);
    EXPECT_EQ(first.partition, second.partition);
    expect_complete(graph, first.partition);

    // The clique structure is found whatever the visiting order
    EXPECT_EQ(first.partition.at("a"), first.partition.at("b"));
    EXPECT_EQ(first.partition.at("b"), first.partition.at("c"));
    EXPECT_EQ(first.partition.at("d"), first.partition.at("f"));
    EXPECT_NE(first.partition.at("a"), first.partition.at("d"));
}

TEST(LouvainDeterminismTest, IdsFollowSortedTagOrder) {
    LouvainConfig config;
    config.seed = 7;
    auto result = ModularityClusterer(config).cluster(two_cliques());

    // First-appearance numbering over sorted tags
    EXPECT_EQ(result.partition.at("a"), 0);
    EXPECT_EQ(result.partition.at("d"), 1);
    EXPECT_EQ(result.partition.at("g"), 2);
}

// ==========================================
// Edge cases and configuration
// ==========================================

TEST(LouvainEdgeCaseTest, EmptyGraph) {
    InterestGraph graph;
    auto result = ModularityClusterer().cluster(graph);
    EXPECT_TRUE(result.partition.empty());
    EXPECT_EQ(result.levels, 0);
}

TEST(LouvainEdgeCaseTest, NoEdgesGivesSingletons) {
    InterestGraph graph{InterestPool(std::set<std::string>{"x", "y", "z"})};
    auto result = ModularityClusterer().cluster(graph);

    Partition expected = {{"x", 0}, {"y", 1}, {"z", 2}};
    EXPECT_EQ(result.partition, expected);
    EXPECT_EQ(result.modularity, 0.0);
}

TEST(LouvainEdgeCaseTest, DisconnectedComponentsClusterIndependently) {
    auto graph = graph_from_edges({"p", "q", "r", "s"}, {{"p", "q", 3}, {"r", "s", 3}});
    auto result = ModularityClusterer().cluster(graph);

    EXPECT_EQ(result.partition.at("p"), result.partition.at("q"));
    EXPECT_EQ(result.partition.at("r"), result.partition.at("s"));
    EXPECT_NE(result.partition.at("p"), result.partition.at("r"));
}

TEST(LouvainEdgeCaseTest, PassCapStillReturnsCompletePartition) {
    LouvainConfig config;
    config.max_passes = 1;
    config.max_levels = 1;
    auto graph = two_cliques();
    auto result = ModularityClusterer(config).cluster(graph);

    expect_complete(graph, result.partition);
    EXPECT_EQ(result.levels, 1);
    ASSERT_EQ(result.pass_modularity.size(), 1);
    EXPECT_EQ(result.pass_modularity[0].size(), 2);
}

TEST(LouvainConfigTest, InvalidResolutionThrows) {
    LouvainConfig config;
    config.resolution = 0.0;
    EXPECT_THROW(ModularityClusterer{config}, std::invalid_argument);

    config.resolution = -1.0;
    EXPECT_THROW(ModularityClusterer{config}, std::invalid_argument);

    config.resolution = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(ModularityClusterer{config}, std::invalid_argument);
}

TEST(LouvainConfigTest, InvalidCapsThrow) {
    LouvainConfig config;
    config.max_passes = 0;
    EXPECT_THROW(ModularityClusterer{config}, std::invalid_argument);

    config = LouvainConfig{};
    config.max_levels = 0;
    EXPECT_THROW(ModularityClusterer{config}, std::invalid_argument);
}

TEST(LouvainTest, ProgressCallbackIsInvoked) {
    ModularityClusterer clusterer;
    int calls = 0;
    clusterer.set_progress_callback([&](const std::string&, int, int) { ++calls; });
    clusterer.cluster(two_cliques());
    EXPECT_GT(calls, 0);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
