#include <codeatlas/analytics.hpp>

#include <gtest/gtest.h>

using namespace codeatlas;

class AnalyticsTest : public ::testing::Test {
protected:
    DependencyGraph graph;

    void nodes(std::initializer_list<EntityId> ids) {
        for (EntityId id : ids) {
            FileNode node;
            node.id = id;
            node.path = "f" + std::to_string(id) + ".py";
            node.name = node.path;
            graph.add_node(node);
        }
    }

    const CouplingMetrics &metrics_for(const std::vector<CouplingMetrics> &all, EntityId id) {
        for (const auto &m : all) {
            if (m.file_id == id) {
                return m;
            }
        }
        ADD_FAILURE() << "no metrics for " << id;
        return all.front();
    }
};

// ============================================================================
// Coupling
// ============================================================================

TEST_F(AnalyticsTest, CouplingCountsAndInstability) {
    nodes({1, 2, 3});
    graph.add_edge(1, 2);
    graph.add_edge(1, 3);
    graph.add_edge(2, 3);

    auto metrics = coupling_metrics(graph);
    ASSERT_EQ(metrics.size(), 3u);

    const auto &a = metrics_for(metrics, 1);
    EXPECT_EQ(a.afferent, 0u);
    EXPECT_EQ(a.efferent, 2u);
    EXPECT_EQ(a.total, 2u);
    EXPECT_DOUBLE_EQ(a.instability, 1.0);
    EXPECT_DOUBLE_EQ(a.abstractness, 0.5);
    EXPECT_DOUBLE_EQ(a.distance, 0.5);

    const auto &b = metrics_for(metrics, 2);
    EXPECT_DOUBLE_EQ(b.instability, 0.5);
    EXPECT_DOUBLE_EQ(b.distance, 0.0);

    const auto &c = metrics_for(metrics, 3);
    EXPECT_EQ(c.afferent, 2u);
    EXPECT_DOUBLE_EQ(c.instability, 0.0);
}

TEST_F(AnalyticsTest, IsolatedFileHasZeroInstability) {
    nodes({7});
    auto metrics = coupling_metrics(graph);
    ASSERT_EQ(metrics.size(), 1u);
    EXPECT_EQ(metrics[0].total, 0u);
    EXPECT_DOUBLE_EQ(metrics[0].instability, 0.0);
    EXPECT_DOUBLE_EQ(metrics[0].distance, 0.5);
}

TEST_F(AnalyticsTest, InstabilityStaysWithinBounds) {
    nodes({1, 2, 3, 4, 5});
    graph.add_edge(1, 2);
    graph.add_edge(2, 3);
    graph.add_edge(3, 1);
    graph.add_edge(4, 1);
    graph.add_edge(5, 4);
    for (const auto &m : coupling_metrics(graph)) {
        EXPECT_GE(m.instability, 0.0);
        EXPECT_LE(m.instability, 1.0);
        EXPECT_GE(m.distance, 0.0);
    }
}

TEST_F(AnalyticsTest, RatioAbstractness) {
    FileNode node;
    node.id = 1;
    node.path = "base.py";
    node.type_count = 4;
    node.abstract_type_count = 1;
    graph.add_node(node);
    nodes({2});
    graph.add_edge(2, 1);

    AnalyticsConfig config;
    config.abstractness = AbstractnessMode::Ratio;
    auto metrics = coupling_metrics(graph, config);

    const auto &base = metrics_for(metrics, 1);
    EXPECT_DOUBLE_EQ(base.abstractness, 0.25);
    EXPECT_DOUBLE_EQ(base.distance, 0.75);
    // No types at all counts as fully concrete
    EXPECT_DOUBLE_EQ(metrics_for(metrics, 2).abstractness, 0.0);
}

// ============================================================================
// Circular dependencies
// ============================================================================

TEST_F(AnalyticsTest, ThreeCycleWithIsolatedNode) {
    nodes({1, 2, 3, 4});
    graph.add_edge(1, 2);
    graph.add_edge(2, 3);
    graph.add_edge(3, 1);

    auto groups = circular_dependencies(graph);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].members, (std::vector<EntityId>{1, 2, 3}));
    EXPECT_EQ(groups[0].member_paths,
              (std::vector<std::string>{"f1.py", "f2.py", "f3.py"}));
    EXPECT_EQ(groups[0].cycle, (std::vector<EntityId>{1, 2, 3}));
}

TEST_F(AnalyticsTest, AcyclicGraphHasNoGroups) {
    nodes({1, 2, 3});
    graph.add_edge(1, 2);
    graph.add_edge(2, 3);
    graph.add_edge(1, 3);
    EXPECT_TRUE(circular_dependencies(graph).empty());

    auto components = strongly_connected_components(graph);
    EXPECT_EQ(components.size(), 3u);
}

TEST_F(AnalyticsTest, SeparateComponentsOrderedBySmallestMember) {
    nodes({1, 2, 3, 4, 5, 6});
    graph.add_edge(5, 6);
    graph.add_edge(6, 5);
    graph.add_edge(2, 4);
    graph.add_edge(4, 2);
    graph.add_edge(4, 5);

    auto groups = circular_dependencies(graph);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].members, (std::vector<EntityId>{2, 4}));
    EXPECT_EQ(groups[1].members, (std::vector<EntityId>{5, 6}));
    EXPECT_EQ(groups[1].cycle, (std::vector<EntityId>{5, 6}));
}

TEST_F(AnalyticsTest, WitnessCycleIsShortestThroughSmallestMember) {
    nodes({1, 2, 3, 4});
    // 1 -> 2 -> 3 -> 4 -> 1 and a shortcut 1 -> 3
    graph.add_edge(1, 2);
    graph.add_edge(2, 3);
    graph.add_edge(3, 4);
    graph.add_edge(4, 1);
    graph.add_edge(1, 3);

    auto components = strongly_connected_components(graph);
    ASSERT_EQ(components.size(), 1u);
    auto cycle = find_cycle(graph, components[0]);
    EXPECT_EQ(cycle, (std::vector<EntityId>{1, 3, 4}));
}

TEST_F(AnalyticsTest, LongChainDoesNotRecurse) {
    const EntityId n = 20000;
    for (EntityId id = 1; id <= n; ++id) {
        FileNode node;
        node.id = id;
        graph.add_node(node);
    }
    for (EntityId id = 1; id < n; ++id) {
        graph.add_edge(id, id + 1);
    }
    graph.add_edge(n, 1);

    auto groups = circular_dependencies(graph);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].members.size(), static_cast<size_t>(n));
    EXPECT_EQ(groups[0].cycle.size(), static_cast<size_t>(n));
}
